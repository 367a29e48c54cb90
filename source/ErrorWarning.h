#ifndef ERROR_WARNING_DEF
#define ERROR_WARNING_DEF

#include "IncludeDefine.h"

class Parameters;

void exitWithError(string messageOut, ostream &streamOut1, ostream &streamOut2, int errorInt, Parameters &P);
void warningMessage(string messageOut, ostream &streamOut1, ostream &streamOut2);

#endif
