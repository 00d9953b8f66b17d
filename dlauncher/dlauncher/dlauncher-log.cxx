#include <dlauncher/dlauncher-log.hxx>

#include <algorithm>
#include <cctype>
#include <memory>

#include <spdlog/sinks/stdout_color_sinks.h>

using namespace std;

namespace dlauncher
{
  spdlog::level::level_enum
  parse_log_level (const string& s)
  {
    string l (s);
    transform (l.begin (), l.end (), l.begin (), [] (unsigned char c)
    {
      return static_cast<char> (tolower (c));
    });

    if (l == "debug")                  return spdlog::level::debug;
    if (l == "warn" || l == "warning") return spdlog::level::warn;
    if (l == "error")                  return spdlog::level::err;

    return spdlog::level::info;
  }

  void
  init_log (spdlog::level::level_enum l)
  {
    auto s (make_shared<spdlog::sinks::stderr_color_sink_mt> ());
    auto g (make_shared<spdlog::logger> ("dlauncher", s));

    g->set_pattern ("%^%l%$: %v");
    g->set_level (l);

    spdlog::set_default_logger (move (g));
  }
}
