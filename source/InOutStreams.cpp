#include "InOutStreams.h"

InOutStreams::InOutStreams() {
    logStdOut=&std::cout;
};

InOutStreams::~InOutStreams() {

    if (logStdOut!=NULL) logStdOut->flush();

    logProgress.flush();
    logMain.flush();
    logFinal.flush();

    logProgress.close();
    logFinal.close();
    logMain.close();
};
