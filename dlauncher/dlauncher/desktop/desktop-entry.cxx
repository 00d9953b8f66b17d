#include <dlauncher/desktop/desktop-entry.hxx>

#include <fstream>
#include <sstream>
#include <system_error>

#include <spdlog/spdlog.h>

#include <dlauncher/error.hxx>

using namespace std;

namespace dlauncher
{
  static inline std::string
  trim (const std::string& s)
  {
    size_t b (s.find_first_not_of (" \t"));
    if (b == std::string::npos)
      return std::string ();

    size_t e (s.find_last_not_of (" \t\r"));
    return s.substr (b, e - b + 1);
  }

  desktop_entry desktop_entry::
  parse (const std::string& s)
  {
    desktop_entry r;
    r.groups_.push_back (group ());

    istringstream is (s);
    size_t ln (0);

    for (std::string l; getline (is, l); )
    {
      ++ln;

      if (!l.empty () && l.back () == '\r')
        l.pop_back ();

      std::string t (trim (l));

      if (!t.empty () && t[0] == '[')
      {
        if (t.back () != ']' || t.size () < 3)
        {
          error e (error_kind::invalid_response,
                   "invalid desktop entry group header");
          e.add_note ("line " + std::to_string (ln) + ": " + l);
          throw e;
        }

        group g;
        g.name = t.substr (1, t.size () - 2);
        r.groups_.push_back (move (g));
        continue;
      }

      line x;
      size_t eq (l.find ('='));

      if (!t.empty () && t[0] != '#' && eq != std::string::npos)
      {
        x.key = trim (l.substr (0, eq));
        x.value = trim (l.substr (eq + 1));
      }

      // Something without a key we keep as text. Lines without '=' are
      // invalid but there is no reason to be strict about it.
      //
      if (x.key.empty ())
        x.text = l;

      r.groups_.back ().lines.push_back (move (x));
    }

    return r;
  }

  desktop_entry desktop_entry::
  read (const fs::path& p)
  {
    ifstream i (p);

    if (!i)
    {
      error_code ec;
      if (!fs::exists (p, ec))
        throw error (error_kind::file_not_found,
                     "desktop entry " + p.string () + " does not exist");

      throw error (error_kind::io_error,
                   "unable to read desktop entry " + p.string ());
    }

    ostringstream s;
    s << i.rdbuf ();

    try
    {
      return parse (s.str ());
    }
    catch (error& e)
    {
      e.add_note ("while reading " + p.string ());
      throw;
    }
  }

  std::string desktop_entry::
  string () const
  {
    std::string r;

    for (const group& g : groups_)
    {
      if (!g.name.empty ())
        r += '[' + g.name + "]\n";

      for (const line& l : g.lines)
      {
        if (l.pair ())
          r += l.key + '=' + l.value;
        else
          r += l.text;

        r += '\n';
      }
    }

    return r;
  }

  void desktop_entry::
  write (const fs::path& p) const
  {
    error_code ec;

    if (p.has_parent_path ())
    {
      fs::create_directories (p.parent_path (), ec);

      if (ec)
      {
        error e (error_kind::io_error, "unable to create directory");
        e.add_note (p.parent_path ().string () + ": " + ec.message ());
        throw e;
      }
    }

    ofstream o (p, ios::trunc);
    o << string ();
    o.close ();

    if (!o)
      throw error (error_kind::io_error,
                   "unable to write desktop entry " + p.string ());
  }

  auto desktop_entry::
  find (const std::string& n) -> group*
  {
    for (group& g : groups_)
      if (g.name == n)
        return &g;

    return nullptr;
  }

  auto desktop_entry::
  find (const std::string& n) const -> const group*
  {
    for (const group& g : groups_)
      if (g.name == n)
        return &g;

    return nullptr;
  }

  bool desktop_entry::
  contains (const std::string& g) const
  {
    return !g.empty () && find (g) != nullptr;
  }

  optional<std::string> desktop_entry::
  get (const std::string& g, const std::string& k) const
  {
    if (const group* x = find (g))
    {
      for (const line& l : x->lines)
        if (l.key == k)
          return l.value;
    }

    return nullopt;
  }

  void desktop_entry::
  set (const std::string& g, const std::string& k, const std::string& v)
  {
    group* x (find (g));

    if (x == nullptr)
    {
      // Keep a blank line between groups, as everyone does.
      //
      if (!groups_.empty ())
      {
        group& p (groups_.back ());
        if (!p.lines.empty () && (p.lines.back ().pair () ||
                                  !p.lines.back ().text.empty ()))
          p.lines.push_back (line ());
      }

      group n;
      n.name = g;
      groups_.push_back (move (n));
      x = &groups_.back ();
    }

    for (line& l : x->lines)
    {
      if (l.key == k)
      {
        l.value = v;
        return;
      }
    }

    line l;
    l.key = k;
    l.value = v;

    // Insert after the last pair so that trailing blank lines stay where
    // they are.
    //
    auto i (x->lines.end ());
    while (i != x->lines.begin () && !(i - 1)->pair ())
      --i;

    x->lines.insert (i, move (l));
  }

  void desktop_entry::
  add_action (const std::string& id)
  {
    std::string as (get ("Actions").value_or (std::string ()));

    // The list is semicolon-terminated but we don't insist on it.
    //
    istringstream is (as);
    for (std::string a; getline (is, a, ';'); )
      if (a == id)
        return;

    if (!as.empty () && as.back () != ';')
      as += ';';

    set ("Actions", as + id + ';');
  }

  std::string
  exec_argument (const std::string& a)
  {
    const char* reserved (" \t\n\"'\\><~|&;$*?#()`");

    if (!a.empty () && a.find_first_of (reserved) == std::string::npos)
    {
      std::string r;
      for (char c : a)
      {
        r += c;
        if (c == '%')
          r += '%';
      }
      return r;
    }

    std::string r ("\"");
    for (char c : a)
    {
      switch (c)
      {
        case '"':
        case '`':
        case '$':
          r += "\\\\";
          r += c;
          break;
        case '\\':
          r += "\\\\\\\\";
          break;
        case '%':
          r += "%%";
          break;
        default:
          r += c;
      }
    }
    r += '"';
    return r;
  }

  void
  customize_entry (desktop_entry& de, const launcher_entry& le)
  {
    const std::string l (le.launcher.string ());
    const std::string x (exec_argument (l));

    de.set ("Icon", le.icon.string ());
    de.set ("Exec", x + " update-run");

    fs::path wd (le.launcher.parent_path ());

    if (!wd.empty ())
      de.set ("Path", wd.string ());
    else
      spdlog::error ("launcher path {} has no parent directory, the desktop "
                     "entry is likely broken (make sure it is absolute)",
                     l);

    if (le.tryexec)
      de.set ("TryExec", l);

    if (le.update_action)
    {
      const std::string g ("Desktop Action update");

      de.set (g, "Name", "Update Discord");
      de.set (g, "Exec", x + " update");
      de.add_action ("update");
    }
  }
}
