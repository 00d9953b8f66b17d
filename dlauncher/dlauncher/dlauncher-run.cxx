#include <dlauncher/dlauncher-run.hxx>

#include <system_error>

#include <spdlog/spdlog.h>

#include <dlauncher/client/client-build-info.hxx>
#include <dlauncher/error.hxx>

using namespace std;

namespace dlauncher
{
  launch_orchestrator::
  launch_orchestrator (const launcher_config& c,
                       instance_coordinator& i,
                       update_coordinator& u)
    : config_ (c),
      instance_ (i),
      update_ (u)
  {
  }

  int launch_orchestrator::
  run (const arguments_type& a)
  {
    fs::path b (config_.binary ());

    {
      error_code ec;
      if (!fs::exists (b, ec))
      {
        error e (error_kind::file_not_found,
                 "Discord binary " + b.string () + " does not exist");
        e.add_note ("use the install command to install Discord");
        throw e;
      }
    }

    // What we advertise. An installation without build info can only come
    // from a forced install and we run it anyway.
    //
    build_info bi {client_version (), to_string (config_.channel)};

    try
    {
      bi = read_build_info (config_.discord_path);
    }
    catch (const error& e)
    {
      if (e.kind () != error_kind::build_info_missing)
        throw;

      spdlog::warn ("{}, advertising version {}",
                    e.what (),
                    bi.version.string ());
    }

    const vector<string>& args (a ? *a : config_.launch_args);

    return instance_.launch (b,
                             args,
                             config_.working_directory,
                             bi.version,
                             bi.channel);
  }

  int launch_orchestrator::
  update_run (bool strict, const arguments_type& a)
  {
    try
    {
      update_.update (strict);
    }
    catch (const error& e)
    {
      if (e.kind () != error_kind::no_update_available)
        throw;

      spdlog::info ("{}", e.what ());

      for (const string& n : e.notes ())
        spdlog::info ("{}", n);
    }

    return run (a);
  }
}
