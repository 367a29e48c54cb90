#include "fasta_io.h"
#include "gap_errors.h"

#include <zlib.h>

#include <cctype>
#include <cstring>
#include <fstream>

namespace gapwalk {

namespace {

// Line reader over gzFile; transparent for uncompressed input
class GzLineReader {
public:
    explicit GzLineReader(const std::string& path) : fp_(gzopen(path.c_str(), "rb")) {}
    ~GzLineReader() {
        if (fp_ != nullptr) gzclose(fp_);
    }

    bool good() const { return fp_ != nullptr; }

    bool getline(std::string& line) {
        line.clear();
        char buf[8192];
        bool gotAny = false;
        while (gzgets(fp_, buf, sizeof(buf)) != nullptr) {
            gotAny = true;
            size_t len = std::strlen(buf);
            if (len > 0 && buf[len - 1] == '\n') {
                line.append(buf, len - 1);
                break;
            }
            line.append(buf, len);
        }
        if (!line.empty() && line[line.size() - 1] == '\r') {
            line.erase(line.size() - 1);
        }
        return gotAny;
    }

private:
    GzLineReader(const GzLineReader&);
    GzLineReader& operator=(const GzLineReader&);

    gzFile fp_;
};

} // namespace

bool isValidSequenceId(const std::string& id) {
    if (id.empty()) return false;
    for (char c : id) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '.') return false;
    }
    return true;
}

bool isValidNucleotideString(const std::string& seq) {
    if (seq.empty()) return false;
    for (char c : seq) {
        switch (c) {
            case 'A': case 'C': case 'G': case 'T': case 'N':
            case 'a': case 'c': case 'g': case 't': case 'n':
                break;
            default:
                return false;
        }
    }
    return true;
}

std::vector<FastaRecord> readFastaRecords(const std::string& path) {
    GzLineReader in(path);
    if (!in.good()) {
        throw std::runtime_error("Cannot open FASTA file: " + path);
    }
    std::vector<FastaRecord> records;
    std::string line;
    while (in.getline(line)) {
        if (line.empty()) continue;
        if (line[0] == '>') {
            FastaRecord rec;
            size_t end = line.find_first_of(" \t");
            rec.id = line.substr(1, end == std::string::npos ? std::string::npos : end - 1);
            records.push_back(rec);
        } else {
            if (records.empty()) {
                throw std::runtime_error("FASTA file does not start with a header line: " + path);
            }
            records.back().sequence += line;
        }
    }
    return records;
}

FastaRecord readReferenceFasta(const std::string& path) {
    GzLineReader in(path);
    if (!in.good()) {
        throw ConfigurationError("could not open reference FASTA file " + path);
    }
    std::vector<std::string> lines;
    std::string line;
    while (in.getline(line)) {
        if (line.empty()) continue;
        lines.push_back(line);
    }
    if (lines.size() != 2) {
        throw ConfigurationError("reference FASTA " + path + " must contain exactly two lines (header and sequence), found "
                                 + std::to_string(lines.size()));
    }
    if (lines[0][0] != '>') {
        throw ConfigurationError("reference FASTA " + path + " does not start with a '>' header line");
    }
    FastaRecord rec;
    rec.id = lines[0].substr(1);
    rec.sequence = lines[1];
    if (!isValidSequenceId(rec.id)) {
        throw ConfigurationError("reference identifier \"" + rec.id + "\" may only contain letters, digits and periods");
    }
    if (!isValidNucleotideString(rec.sequence)) {
        throw ConfigurationError("reference sequence of " + rec.id + " contains characters other than A/C/G/T/N");
    }
    return rec;
}

void writeFasta(const std::string& path, const FastaRecord& record) {
    writeFasta(path, std::vector<FastaRecord>(1, record));
}

void writeFasta(const std::string& path, const std::vector<FastaRecord>& records) {
    std::ofstream out(path.c_str());
    if (!out.good()) {
        throw std::runtime_error("Cannot create FASTA file: " + path);
    }
    for (const auto& r : records) {
        out << '>' << r.id << '\n' << r.sequence << '\n';
    }
    out.flush();
    if (out.fail()) {
        throw std::runtime_error("Failed writing FASTA file: " + path);
    }
}

bool looksLikeFastq(const std::string& path) {
    GzLineReader in(path);
    if (!in.good()) return false;
    std::string line;
    while (in.getline(line)) {
        if (line.empty()) continue;
        return line[0] == '@';
    }
    return false;
}

} // namespace gapwalk
