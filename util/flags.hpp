#ifndef UTIL_FLAGS_HPP
#define UTIL_FLAGS_HPP

#include "gflags/gflags.h"

// Execution limits
DECLARE_int64(max_cpu_seconds);
DECLARE_int64(max_wall_seconds);
DECLARE_int64(max_memory_bytes);
DECLARE_int64(max_output_bytes);
DECLARE_int32(max_files);
DECLARE_int64(max_file_size_kb);
DECLARE_int32(max_processes);
DECLARE_int32(kill_grace_millis);

// Admission control
DECLARE_int32(max_concurrent_executions);
DECLARE_int32(max_queued_executions);

// Static policy
DECLARE_string(forbidden_tokens);
DECLARE_string(forbidden_tokens_file);
DECLARE_int64(max_code_bytes);

// Interpreter
DECLARE_string(language);
DECLARE_string(interpreter);
DECLARE_string(interpreter_args);
DECLARE_string(out_of_memory_marker);
DECLARE_bool(echo_last_expression);

// Sandbox
DECLARE_string(temp_directory);
DECLARE_bool(keep_sandboxes);
DECLARE_bool(isolate);
DECLARE_string(sandbox_readonly_paths);

#endif
