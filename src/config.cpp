#include "config.hpp"

namespace boxjudge {
using namespace std;

filesystem::path RUN_DIR = "/tmp/boxjudge/run";
string DOCKER_BIN = "docker";
size_t MAX_WORKERS = 4;
int MAX_PROCESSES = 64;
double SANDBOX_CPUS = 1.0;
int COMPILE_TIME_LIMIT = 10000;                // 10s
int64_t COMPILE_MEMORY_LIMIT = 512ll << 20;    // 512M
int CLEANUP_TIMEOUT = 10000;                   // 10s
int RUNTIME_CALL_TIMEOUT = 30000;              // 30s
int SAMPLE_INTERVAL = 50;                      // 50ms
size_t OUTPUT_LIMIT = 64 << 20;                // 64M
bool DEBUG = false;

}  // namespace boxjudge
