#include <dlauncher/archive/archive-reader.hxx>

#include <memory>

#include <archive.h>
#include <archive_entry.h>

#include <dlauncher/error.hxx>

using namespace std;

namespace dlauncher
{
  using read_handle = unique_ptr<archive, decltype (&archive_read_free)>;
  using write_handle = unique_ptr<archive, decltype (&archive_write_free)>;

  static error
  archive_failure (archive* a, const string& what)
  {
    const char* m (archive_error_string (a));
    return error (error_kind::archive_error,
                  what + ": " + (m != nullptr ? m : "unknown error"));
  }

  // Open the in-memory archive for reading.
  //
  static read_handle
  open_archive (const string& d)
  {
    read_handle a (archive_read_new (), &archive_read_free);

    if (!a)
      throw error (error_kind::archive_error,
                   "unable to allocate archive reader");

    archive_read_support_filter_gzip (a.get ());
    archive_read_support_format_tar (a.get ());

    if (archive_read_open_memory (a.get (), d.data (), d.size ()) != ARCHIVE_OK)
      throw archive_failure (a.get (), "unable to open archive");

    return a;
  }

  // Return true if the root-relative path stays under the root.
  //
  static bool
  safe (const string& p)
  {
    fs::path rp (p);

    if (rp.is_absolute () || rp.has_root_name ())
      return false;

    for (const fs::path& c : rp)
      if (c == "..")
        return false;

    return true;
  }

  static error
  unsafe_entry (const char* n)
  {
    return error (error_kind::archive_error,
                  "refusing to extract unsafe entry " + string (n));
  }

  static error
  unsafe_hardlink (const char* n, const char* h)
  {
    return error (error_kind::archive_error,
                  "refusing to extract hardlink " + string (n) + " to " + h);
  }

  archive_reader::
  archive_reader (const string& d)
    : data_ (d)
  {
  }

  optional<string> archive_reader::
  strip_root (const string& e, release_channel* c)
  {
    for (release_channel rc : {release_channel::stable,
                               release_channel::ptb,
                               release_channel::canary})
    {
      string r (archive_root (rc));

      if (e.size () > r.size () && e.compare (0, r.size (), r) == 0)
      {
        if (c != nullptr)
          *c = rc;

        return e.substr (r.size ());
      }
    }

    return nullopt;
  }

  archive_scan archive_reader::
  scan () const
  {
    archive_scan r;
    read_handle a (open_archive (data_));

    archive_entry* e;
    int s;

    while ((s = archive_read_next_header (a.get (), &e)) == ARCHIVE_OK ||
           s == ARCHIVE_WARN)
    {
      const char* n (archive_entry_pathname (e));
      release_channel c (release_channel::stable);

      optional<string> p (n != nullptr ? strip_root (n, &c) : nullopt);

      if (!p)
      {
        archive_read_data_skip (a.get ());
        continue;
      }

      if (!safe (*p))
        throw unsafe_entry (n);

      if (const char* h = archive_entry_hardlink (e))
      {
        optional<string> hp (strip_root (h));

        if (!hp || !safe (*hp))
          throw unsafe_hardlink (n, h);
      }

      ++r.entries;

      if (!r.root)
        r.root = c;

      if (*p == build_info_path &&
          !r.build_info &&
          archive_entry_filetype (e) == AE_IFREG)
      {
        string b;
        const void* buf;
        size_t sz;
        la_int64_t off;

        while ((s = archive_read_data_block (a.get (), &buf, &sz, &off)) ==
               ARCHIVE_OK)
          b.append (static_cast<const char*> (buf), sz);

        if (s != ARCHIVE_EOF)
          throw archive_failure (a.get (), "unable to read " + string (n));

        r.build_info = move (b);
      }
      else
        archive_read_data_skip (a.get ());
    }

    if (s != ARCHIVE_EOF)
      throw archive_failure (a.get (), "unable to read archive headers");

    return r;
  }

  size_t archive_reader::
  extract (const fs::path& d) const
  {
    read_handle a (open_archive (data_));
    write_handle w (archive_write_disk_new (), &archive_write_free);

    if (!w)
      throw error (error_kind::archive_error,
                   "unable to allocate archive writer");

    // Note that we can't use ARCHIVE_EXTRACT_SECURE_NOABSOLUTEPATHS since we
    // rewrite every path to be under the (absolute) destination. Instead we
    // validate the relative path ourselves before rewriting.
    //
    archive_write_disk_set_options (w.get (),
                                    ARCHIVE_EXTRACT_TIME |
                                    ARCHIVE_EXTRACT_PERM |
                                    ARCHIVE_EXTRACT_SECURE_NODOTDOT |
                                    ARCHIVE_EXTRACT_SECURE_SYMLINKS);
    archive_write_disk_set_standard_lookup (w.get ());

    size_t r (0);
    archive_entry* e;
    int s;

    while ((s = archive_read_next_header (a.get (), &e)) == ARCHIVE_OK ||
           s == ARCHIVE_WARN)
    {
      const char* n (archive_entry_pathname (e));
      optional<string> p (n != nullptr ? strip_root (n) : nullopt);

      if (!p)
      {
        archive_read_data_skip (a.get ());
        continue;
      }

      if (!safe (*p))
        throw unsafe_entry (n);

      string t ((d / *p).string ());
      archive_entry_set_pathname (e, t.c_str ());

      // Hardlinks name another entry, so the target has to be moved along.
      //
      if (const char* h = archive_entry_hardlink (e))
      {
        optional<string> hp (strip_root (h));

        if (!hp || !safe (*hp))
          throw unsafe_hardlink (n, h);

        string ht ((d / *hp).string ());
        archive_entry_set_hardlink (e, ht.c_str ());
      }

      if (archive_write_header (w.get (), e) < ARCHIVE_WARN)
        throw archive_failure (w.get (), "unable to extract " + string (n));

      if (archive_entry_size (e) > 0)
      {
        const void* buf;
        size_t sz;
        la_int64_t off;

        while ((s = archive_read_data_block (a.get (), &buf, &sz, &off)) ==
               ARCHIVE_OK)
        {
          if (archive_write_data_block (w.get (), buf, sz, off) < ARCHIVE_WARN)
            throw archive_failure (w.get (), "unable to write " + t);
        }

        if (s != ARCHIVE_EOF)
          throw archive_failure (a.get (), "unable to read " + string (n));
      }

      if (archive_write_finish_entry (w.get ()) < ARCHIVE_WARN)
        throw archive_failure (w.get (), "unable to finish " + t);

      ++r;
    }

    if (s != ARCHIVE_EOF)
      throw archive_failure (a.get (), "unable to read archive headers");

    if (archive_write_close (w.get ()) != ARCHIVE_OK)
      throw archive_failure (w.get (), "unable to finalize extraction");

    return r;
  }
}
