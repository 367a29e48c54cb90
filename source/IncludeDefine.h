#ifndef INCLUDEDEFINE_DEF
#define INCLUDEDEFINE_DEF

//standard libs
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace std;

#define GAPWALK_VERSION "1.2.0"

#ifndef COMPILATION_TIME_PLACE
    #define COMPILATION_TIME_PLACE __DATE__ " " __TIME__
#endif

//exit codes
#define EXIT_CODE_BUG 101
#define EXIT_CODE_PARAMETER 102
#define EXIT_CODE_RUNTIME 103
#define EXIT_CODE_INPUT_FILES 104
#define EXIT_CODE_TOOLS 105
#define EXIT_CODE_COLLABORATOR 106
#define EXIT_CODE_UNRESOLVABLE_GAP 107
#define EXIT_CODE_FILE_OPEN 109

#define MAX_N_MATES 2

typedef uint8_t uint8;
typedef int32_t int32;
typedef uint32_t uint32;
typedef int64_t int64;
typedef uint64_t uint64;
#define uint unsigned long long

#endif
