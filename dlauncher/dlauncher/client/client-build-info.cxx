#include <dlauncher/client/client-build-info.hxx>

#include <fstream>
#include <sstream>

#include <boost/json.hpp>

#include <dlauncher/error.hxx>

using namespace std;

namespace dlauncher
{
  namespace json = boost::json;

  build_info
  parse_build_info (const string& s)
  {
    boost::system::error_code ec;
    json::value jv (json::parse (s, ec));

    if (ec)
      throw error (error_kind::build_info_malformed,
                   "failed to parse build info: " + ec.message ());

    if (!jv.is_object ())
      throw error (error_kind::build_info_malformed,
                   "build info JSON must be an object");

    const json::object& o (jv.as_object ());

    // Both fields are required. We deliberately don't default the channel to
    // stable since that would turn a broken install into a channel mismatch
    // further down the line.
    //
    auto field = [&o] (const char* n) -> string
    {
      const json::value* v (o.if_contains (n));

      if (v == nullptr)
        throw error (error_kind::build_info_malformed,
                     string ("build info is missing '") + n + "'");

      if (!v->is_string ())
        throw error (error_kind::build_info_malformed,
                     string ("build info '") + n + "' must be a string");

      return json::value_to<string> (*v);
    };

    string vs (field ("version"));

    build_info r;
    r.channel = field ("releaseChannel");

    optional<client_version> v (parse_client_version (vs));

    if (!v)
    {
      error e (error_kind::invalid_version_format,
               "failed to parse Discord version");
      e.add_note ("no <major>.<minor>.<patch> at the start of \"" + vs + '"');
      throw e;
    }

    r.version = *v;
    return r;
  }

  build_info
  read_build_info (const fs::path& d)
  {
    fs::path p (d / build_info_path);

    error_code ec;
    fs::file_status st (fs::status (p, ec));

    if (!fs::exists (st))
    {
      error e (error_kind::build_info_missing,
               "failed to find Discord build_info.json");
      e.add_note ("expected path: " + p.string ());
      throw e;
    }

    if (fs::is_directory (st))
    {
      error e (error_kind::is_a_directory,
               "build info path is a directory");
      e.add_note ("path: " + p.string ());
      throw e;
    }

    ifstream ifs (p, ios::binary);
    if (!ifs)
    {
      error e (error_kind::build_info_missing,
               "unable to open Discord build_info.json");
      e.add_note ("path: " + p.string ());
      throw e;
    }

    ostringstream os;
    os << ifs.rdbuf ();

    try
    {
      return parse_build_info (os.str ());
    }
    catch (error& e)
    {
      e.add_note ("while reading " + p.string ());
      throw;
    }
  }
}
