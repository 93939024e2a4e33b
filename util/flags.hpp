#ifndef UTIL_FLAGS_HPP
#define UTIL_FLAGS_HPP

#include "gflags/gflags.h"

// Filesystem
DECLARE_string(temp_directory);
DECLARE_bool(keep_sandboxes);

// Sandbox selection
DECLARE_bool(allow_insecure_sandbox);
DECLARE_string(bwrap);

// Compilation
DECLARE_string(compiler);
DECLARE_int32(max_source_bytes);
DECLARE_int32(compile_timeout_ms);

// Execution limits
DECLARE_int32(timeout_ms);
DECLARE_int32(kill_grace_ms);
DECLARE_int64(max_output_bytes);
DECLARE_int64(memory_limit_kb);
DECLARE_int64(max_file_size_kb);

#endif
