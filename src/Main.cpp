#include "CommandLine.hpp"
#include "Engine.hpp"
#include "Common.hpp"
#include "Stats.hpp"
#include "SignalHandler.hpp"

int main(int argc, char* argv[])
{
  using namespace sf;

  InitCommon();

  EngineOptions options;
  EngineOptionsInit(&options);

  // Scan options from command line, update argc/argv
  if (!CommandLineParseOptions(&options, &argc, &argv))
  {
    CommandLineShowHelp();
    return EngineResult::kSetupError;
  }

  if (options.m_ShowHelp)
  {
    CommandLineShowHelp();
    return 0;
  }

  SetLogFlags(CommandLineLogFlags(&options));

  // Must happen before any other thread starts.
  SignalHandlerInit();

  uint64_t start_time = TimerGet();

  int exit_code = CommandLineRun(&options, argc, argv);

  if (options.m_DisplayStats)
    StatsPrint();

  Log(kDebug, "finished in %.2f seconds", TimerDiffSeconds(start_time, TimerGet()));

  return exit_code;
}
