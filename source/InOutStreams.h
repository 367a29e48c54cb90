#ifndef INOUTSTREAMS_DEF
#define INOUTSTREAMS_DEF

#include "IncludeDefine.h"

class InOutStreams {
    public:
    ostream *logStdOut;

    ofstream logMain, logProgress, logFinal;

    InOutStreams();
    ~InOutStreams();
};

#endif
