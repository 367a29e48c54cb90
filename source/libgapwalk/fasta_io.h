#ifndef GAPWALK_FASTA_IO_H
#define GAPWALK_FASTA_IO_H

#include "gap_types.h"

#include <string>
#include <vector>

namespace gapwalk {

// All records of a FASTA file, plain or gzip-compressed. Multi-line
// sequences are joined. Throws std::runtime_error when the file cannot be read.
std::vector<FastaRecord> readFastaRecords(const std::string& path);

// Reference FASTA: exactly one header line (>id, id of [A-Za-z0-9.]) and one
// sequence line of A/C/G/T/N in any case. Throws ConfigurationError otherwise.
FastaRecord readReferenceFasta(const std::string& path);

bool isValidSequenceId(const std::string& id);
bool isValidNucleotideString(const std::string& seq);

// Single-line FASTA record; throws std::runtime_error on write failure
void writeFasta(const std::string& path, const FastaRecord& record);
void writeFasta(const std::string& path, const std::vector<FastaRecord>& records);

// First character of a plain or gzip file is '@'
bool looksLikeFastq(const std::string& path);

} // namespace gapwalk

#endif // GAPWALK_FASTA_IO_H
