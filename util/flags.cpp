#include "util/flags.hpp"

DEFINE_string(temp_directory, "/tmp/cwarden",
              "Where the per-request sandbox directories should be created");
DEFINE_bool(keep_sandboxes, false,
            "Do not delete the per-request directories (debugging only)");

DEFINE_bool(allow_insecure_sandbox,
            gflags::BoolFromEnv("ALLOW_INSECURE_SANDBOX", false),
            "Run untrusted programs without syscall filtering or namespaces "
            "when no real sandbox is available. DEVELOPMENT ONLY");
DEFINE_string(bwrap, "bwrap", "bubblewrap binary used for namespace isolation");

DEFINE_string(compiler, "cc", "C compiler, looked up in PATH");
DEFINE_int32(max_source_bytes, 10240, "Largest accepted submission, in bytes");
DEFINE_int32(compile_timeout_ms, 10000, "Wall clock limit for the compiler");

DEFINE_int32(timeout_ms, 5000, "Wall clock limit for the submitted program");
DEFINE_int32(kill_grace_ms, 500,
             "How long to wait for output pipes to drain after a kill");
DEFINE_int64(max_output_bytes, 64 * 1024,
             "Bytes kept from stdout and from stderr; the rest is dropped");
DEFINE_int64(memory_limit_kb, 256 * 1024,
             "Address space limit for the submitted program");
DEFINE_int64(max_file_size_kb, 1024,
             "Largest file the submitted program may write");
