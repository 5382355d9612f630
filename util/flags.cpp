#include "util/flags.hpp"

DEFINE_int64(max_cpu_seconds, 10, "CPU time limit of a single execution");
DEFINE_int64(max_wall_seconds, 10,
             "Wall clock limit of a single execution. Must not be smaller "
             "than --max_cpu_seconds");
DEFINE_int64(max_memory_bytes, 128LL * 1024 * 1024,
             "Address space limit of a single execution");
DEFINE_int64(max_output_bytes, 1024 * 1024,
             "Bytes of stdout and of stderr kept for each execution");
DEFINE_int32(max_files, 64, "Maximum number of open files of a program");
DEFINE_int64(max_file_size_kb, 1024,
             "Maximum size of a file written by a program");
DEFINE_int32(max_processes, 64,
             "Maximum number of processes and threads of a program");
DEFINE_int32(kill_grace_millis, 2000,
             "How long to wait for a killed program before giving up on it");

DEFINE_int32(max_concurrent_executions, 0,
             "Number of programs that can run at the same time. If unset, "
             "autodetect");
DEFINE_int32(max_queued_executions, 16,
             "Number of requests that can wait for a free execution slot");

DEFINE_string(forbidden_tokens, "",
              "Comma separated list of forbidden identifiers, in the form "
              "pattern or pattern=category. Replaces the default list");
DEFINE_string(forbidden_tokens_file, "",
              "File with one forbidden identifier per line, in the same "
              "format as --forbidden_tokens");
DEFINE_int64(max_code_bytes, 64 * 1024, "Maximum size of a submitted program");

DEFINE_string(language, "python", "Language accepted by this instance");
DEFINE_string(interpreter, "/usr/bin/python3",
              "Interpreter used to run programs, looked up in PATH if not "
              "absolute");
DEFINE_string(interpreter_args, "-I,-B",
              "Comma separated arguments passed to the interpreter before "
              "the program file");
DEFINE_string(out_of_memory_marker, "MemoryError",
              "Text printed by the interpreter on stderr when it runs out of "
              "memory");
DEFINE_bool(echo_last_expression, true,
            "Print the value of the last line if it is a bare expression");

DEFINE_string(temp_directory, "/tmp/codebox",
              "Where the sandboxes should be created");
DEFINE_bool(keep_sandboxes, false, "Do not remove sandbox directories");
DEFINE_bool(isolate, true,
            "Run programs in their own user, PID, mount and network "
            "namespaces. If isolation is not available, executions fail");
DEFINE_string(sandbox_readonly_paths,
              "/usr,/lib,/lib32,/lib64,/libx32,/bin,/etc",
              "Comma separated host paths visible, read-only, to isolated "
              "programs. Paths that do not exist are skipped");
