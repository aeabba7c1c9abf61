#include "verifier/config.hpp"

namespace verifier {
using namespace std;

const char *DEFAULT_INPUT_SUFFIX = "inp";
const char *DEFAULT_OUTPUT_SUFFIX = "out";

filesystem::path TMP_DIR = "tmp";
filesystem::path LOG_DIR = "logs";
string COMPILE_COMMAND = "g++ {source} -std=c++14 -O2 -I testlib -o {exec}";
double SCRIPT_TIME_LIMIT = 10;  // 10s
bool KEEP_OUTPUTS = false;
bool DEBUG = false;

}  // namespace verifier
