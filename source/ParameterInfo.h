#ifndef PARAMETERSINFO_DEF
#define PARAMETERSINFO_DEF

#include "IncludeDefine.h"

class ParameterInfoBase {
public:
    string nameString; //string that identifies parameter
    int inputLevel; //where the parameter was defined: -1 not defined, 0 default, 1 command line (initial), 2 command line, 3.. parameters files
    int inputLevelAllowed; //highest input level that may define the parameter, -1 for any
    virtual void inputValues(istringstream &streamIn) =0;
    friend std::ostream& operator<< (std::ostream& o, ParameterInfoBase const& b);
    virtual ~ParameterInfoBase() {};
protected:
    virtual void printValues(std::ostream& o) const = 0;
};

inline std::ostream& operator<< (std::ostream& o, ParameterInfoBase const& b) {
    b.printValues(o);
    return o;
};

template <class parameterType>
inline parameterType inputOneValue (istringstream &streamIn) {
    parameterType oneV;
    streamIn >> oneV;
    return oneV;
};

template <>
inline string inputOneValue <string> (istringstream &streamIn) {
    string oneV="";
    streamIn >> ws;//skip whitespace
    if (streamIn.peek()!='"') {//simple parameter with no spaces or "
        streamIn >> oneV;
    } else {
        streamIn.get();//skip "
        getline(streamIn,oneV,'"');
    };
    return oneV;
};

template <class parameterType>
inline void printOneValue (parameterType *value, std::ostream& outStr) {
    outStr << *value;
};

template <>
inline void printOneValue (string *value, std::ostream& outStr) {
    if ((*value).find_first_of(" \t")!=std::string::npos) {//there is white space in the argument, put "" around
        outStr << '\"' << *value <<'\"';
    } else {
        outStr << *value;
    };
};

template <class parameterType>
class ParameterInfoScalar : public ParameterInfoBase {
public:
    parameterType *value;

    ParameterInfoScalar(int inputLevelIn, int inputLevelAllowedIn, string nameStringIn, parameterType* valueIn) {
        nameString=nameStringIn;
        inputLevel=inputLevelIn;
        inputLevelAllowed=inputLevelAllowedIn;
        value=valueIn;
    };

    void inputValues(istringstream &streamIn) {
        *value=inputOneValue <parameterType> (streamIn);
        if ( streamIn.fail() ) {
            ostringstream errOut;
            errOut <<"EXITING: FATAL INPUT ERROR: could not read value for parameter \""<< nameString <<"\"\n";
            errOut <<"SOLUTION: check the value type and format\n"<<flush;
            throw std::runtime_error(errOut.str());
        };
    };

    ~ParameterInfoScalar() {};
private:
    virtual void printValues(std::ostream& outStr) const {
        printOneValue(value, outStr);
    };
};

template <class parameterType>
class ParameterInfoVector : public ParameterInfoBase {
public:
    vector <parameterType> *value;

    ParameterInfoVector(int inputLevelIn, int inputLevelAllowedIn, string nameStringIn, vector <parameterType> *valueIn) {
        nameString=nameStringIn;
        inputLevel=inputLevelIn;
        inputLevelAllowed=inputLevelAllowedIn;
        value=valueIn;
    };

    void inputValues(istringstream &streamIn) {
        (*value).clear();
        while (streamIn.good()) {
            (*value).push_back(inputOneValue <parameterType> (streamIn));
            streamIn >> ws; //remove white space from the end
            if ( streamIn.fail() ) {
                ostringstream errOut;
                errOut <<"EXITING: FATAL INPUT ERROR: could not read values for parameter \""<< nameString <<"\"\n";
                errOut <<"SOLUTION: check the value types and formats\n"<<flush;
                throw std::runtime_error(errOut.str());
            };
        };
    };

    ~ParameterInfoVector() {};
private:
    virtual void printValues(std::ostream& outStr) const {
        for (int ii=0; ii < (int) (*value).size(); ii++) {
            printOneValue(&(*value).at(ii),outStr);
            outStr<<"   ";
        };
    };
};

#endif
