#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace dlauncher
{
  namespace fs = std::filesystem;

  // Desktop entry file.
  //
  // We only ever modify entries that someone else wrote (the one shipped
  // with the client) so the representation is line-based: everything we
  // don't touch, including comments, blank lines, localized keys and the
  // order of groups and keys, is written back exactly as it was read.
  //
  class desktop_entry
  {
  public:
    static constexpr const char main_group[] = "Desktop Entry";

    // A line is either a key/value pair or anything else (comment, blank),
    // kept verbatim in text.
    //
    struct line
    {
      std::string key;
      std::string value;
      std::string text;

      bool
      pair () const noexcept {return !key.empty ();}
    };

    struct group
    {
      std::string name;           // Empty for lines before the first group.
      std::vector<line> lines;
    };

    // Throw error (invalid_response) on malformed group headers.
    //
    static desktop_entry
    parse (const std::string&);

    // Throw error (file_not_found) if the file does not exist.
    //
    static desktop_entry
    read (const fs::path&);

    std::string
    string () const;

    // Write, creating parent directories as necessary.
    //
    void
    write (const fs::path&) const;

    bool
    contains (const std::string& group) const;

    std::optional<std::string>
    get (const std::string& group, const std::string& key) const;

    // Replace the value in place if the key exists, otherwise append the
    // key to the group, adding the group at the end if necessary.
    //
    void
    set (const std::string& group,
         const std::string& key,
         const std::string& value);

    // Shortcuts for the main group.
    //
    std::optional<std::string>
    get (const std::string& key) const
    {
      return get (main_group, key);
    }

    void
    set (const std::string& key, const std::string& value)
    {
      set (main_group, key, value);
    }

    // Add the action to the semicolon-separated Actions list unless it is
    // already there.
    //
    void
    add_action (const std::string& id);

    const std::vector<group>&
    groups () const noexcept {return groups_;}

  private:
    group*
    find (const std::string&);

    const group*
    find (const std::string&) const;

    std::vector<group> groups_;
  };

  // What the launcher puts into its desktop entry.
  //
  struct launcher_entry
  {
    fs::path icon;
    fs::path launcher;
    bool tryexec = true;
    bool update_action = false;
  };

  // Format a single Exec argument as it appears in the file. Arguments with
  // reserved characters are double-quoted with the quoting backslashes
  // themselves escaped (the value is also a string). A `%` is always
  // doubled so that it is not taken for a field code.
  //
  std::string
  exec_argument (const std::string&);

  // Turn the client's sample entry into the launcher entry.
  //
  void
  customize_entry (desktop_entry&, const launcher_entry&);
}
