#include <dlauncher/client/client-build-info.hxx>

#include <cassert>
#include <filesystem>
#include <fstream>

#include <dlauncher/error.hxx>

using namespace std;
using namespace dlauncher;

namespace fs = std::filesystem;

// Return the kind of error thrown by parsing the text, or nullopt if it
// parsed.
//
static optional<error_kind>
parse_kind (const string& s)
{
  try
  {
    parse_build_info (s);
  }
  catch (const error& e)
  {
    return e.kind ();
  }
  return nullopt;
}

static void
test_parse ()
{
  build_info bi (parse_build_info (
    R"({"releaseChannel":"stable","version":"0.0.91"})"));

  assert (bi.channel == "stable");
  assert (bi.version == client_version (0, 0, 91));

  // Extra fields are ignored, channel is taken verbatim.
  //
  bi = parse_build_info (
    R"({"releaseChannel":"development","version":"1.2.3-x","newUpdater":true})");

  assert (bi.channel == "development");
  assert (bi.version == client_version (1, 2, 3));
}

static void
test_parse_fail ()
{
  using k = error_kind;

  assert (parse_kind ("") == k::build_info_malformed);
  assert (parse_kind ("{") == k::build_info_malformed);
  assert (parse_kind ("[]") == k::build_info_malformed);
  assert (parse_kind (R"({"version":"1.2.3"})") == k::build_info_malformed);
  assert (parse_kind (R"({"releaseChannel":"ptb"})") == k::build_info_malformed);
  assert (parse_kind (R"({"releaseChannel":"ptb","version":123})") ==
          k::build_info_malformed);

  // Present and well-formed JSON but the version itself is garbage.
  //
  assert (parse_kind (R"({"releaseChannel":"ptb","version":"latest"})") ==
          k::invalid_version_format);
}

static void
test_read ()
{
  fs::path d (fs::temp_directory_path () / "dlauncher-build-info-test");

  fs::remove_all (d);

  // Nothing there at all.
  //
  try
  {
    read_build_info (d);
    assert (false);
  }
  catch (const error& e)
  {
    assert (e.kind () == error_kind::build_info_missing);
    assert (!e.notes ().empty ());
  }

  // Directory in place of the file.
  //
  fs::create_directories (d / "resources" / "build_info.json");

  try
  {
    read_build_info (d);
    assert (false);
  }
  catch (const error& e)
  {
    assert (e.kind () == error_kind::is_a_directory);
  }

  fs::remove_all (d / "resources" / "build_info.json");

  // Malformed file keeps its kind and gains the path.
  //
  {
    ofstream o (d / "resources" / "build_info.json");
    o << "not json";
  }

  try
  {
    read_build_info (d);
    assert (false);
  }
  catch (const error& e)
  {
    assert (e.kind () == error_kind::build_info_malformed);
    assert (e.notes ().back ().find ("build_info.json") != string::npos);
  }

  // And finally a good one.
  //
  {
    ofstream o (d / "resources" / "build_info.json", ios::trunc);
    o << R"({"releaseChannel":"canary","version":"0.0.650"})";
  }

  build_info bi (read_build_info (d));
  assert (bi.channel == "canary");
  assert (bi.version == client_version (0, 0, 650));

  fs::remove_all (d);
}

int
main ()
{
  test_parse ();
  test_parse_fail ();
  test_read ();
}
