#ifndef SNAPFETCH_COMMANDLINE_HPP
#define SNAPFETCH_COMMANDLINE_HPP

#include "Common.hpp"
#include "Buffer.hpp"
#include "Verifier.hpp"

namespace sf
{

struct EngineOptions;
struct MemAllocHeap;

// Parse the options following the program name. On success argc/argv are
// advanced to the command word.
bool CommandLineParseOptions(EngineOptions* options, int* argc, char*** argv);

void CommandLineShowHelp();

// Log flags selected by --verbose, --debug and --quiet.
int CommandLineLogFlags(const EngineOptions* options);

// Validate the arguments of "verify": <count> <checksum,...> <file,...>.
// Checksums and filenames pair up by position and the lists are split in
// place, so the requests point into argv. Prints the problem and returns false
// on a usage error.
bool CommandLineParseVerifyArgs(
    int                     argc,
    char**                  argv,
    MemAllocHeap*           heap,
    Buffer<char*>*          checksums,
    Buffer<char*>*          filenames,
    Buffer<VerifyRequest>*  requests);

// Run `argv[0]` (sync, recover or verify) with the arguments after it.
// Returns the process exit code, one of the EngineResult values.
int CommandLineRun(const EngineOptions* options, int argc, char** argv);

}

#endif
