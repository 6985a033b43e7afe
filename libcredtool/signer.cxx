// file      : libcredtool/signer.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libcredtool/signer.hxx>

#include <cctype>  // isspace()
#include <sstream>

#include <libbutl/uuid.hxx>
#include <libbutl/base64.hxx>
#include <libbutl/openssl.hxx>
#include <libbutl/process-io.hxx> // operator<<(ostream, process_args)
#include <libbutl/fdstream.hxx>
#include <libbutl/filesystem.hxx> // file_exists()

#include <libcredtool/jwt.hxx>
#include <libcredtool/failure.hxx>
#include <libcredtool/process.hxx>

using namespace std;
using namespace butl;

namespace credtool
{
  string
  generate_nonce ()
  {
    try
    {
      return uuid::generate ().string ();
    }
    catch (const system_error& e)
    {
      throw failure (failure_kind::signing_failure,
                     string ("unable to generate nonce: ") + e.what ());
    }
  }

  // Verify that the private key file exists and looks like a PEM-encoded
  // private key. Note that the key itself is never printed.
  //
  static void
  check_private_key (const path& pk)
  {
    auto unavailable = [&pk] (const string& d)
    {
      throw failure (failure_kind::key_unavailable,
                     "private key " + pk.string () + ": " + d);
    };

    if (pk.empty ())
      unavailable ("no private key specified");

    try
    {
      // Only read regular files: reading a FIFO or a device could block
      // indefinitely.
      //
      if (!file_exists (pk))
        unavailable ("file does not exist or is not a regular file");

      ifdstream is (pk);
      string k (is.read_text ());
      is.close ();

      size_t b (k.find ("-----BEGIN "));
      size_t h (b != string::npos ? k.find ("PRIVATE KEY-----", b) : b);
      size_t e (h != string::npos ? k.find ("-----END ", h) : h);

      if (e == string::npos)
        unavailable ("not a PEM-encoded private key");

      // Decode the body skipping the encapsulated headers (Proc-Type, etc),
      // if any.
      //
      string d;
      {
        size_t p (k.find ('\n', h));
        string l;

        for (istringstream ls (string (k, p, e - p)); getline (ls, l); )
        {
          if (l.find (':') != string::npos)
            continue;

          for (char c: l)
          {
            if (!isspace (static_cast<unsigned char> (c)))
              d += c;
          }
        }
      }

      try
      {
        if (d.empty () || base64_decode (d).empty ())
          unavailable ("empty PEM body");
      }
      catch (const invalid_argument&)
      {
        unavailable ("invalid PEM encoding");
      }
    }
    catch (const io_error& e)
    {
      unavailable (string ("unable to read: ") + e.what ());
    }
    catch (const system_error& e) // file_exists()
    {
      unavailable (string ("unable to stat: ") + e.what ());
    }
  }

  openssl_signer::
  openssl_signer (const openssl_options& o,
                  pipeline_clock& c,
                  const cancellation& cn,
                  duration tm,
                  chrono::seconds bd,
                  const basic_mark* t)
      : options_ (o),
        clock_ (c),
        cancel_ (cn),
        timeout_ (tm),
        backdate_ (bd),
        trace_ (t)
  {
    if (tm <= duration::zero ())
      throw invalid_argument ("non-positive signing timeout");
  }

  signed_assertion openssl_signer::
  sign (const identity& id, const chrono::seconds& ttl)
  {
    if (ttl <= chrono::seconds::zero () || ttl > max_jwt_validity)
      throw invalid_argument ("invalid assertion validity period " +
                              to_string (ttl.count ()) + "s");

    check_private_key (id.private_key);

    signed_assertion r (jwt_claims (id, clock_.now (), ttl, backdate_));
    r.nonce = generate_nonce ();

    string m (jwt_message (r));

    auto fail = [] (failure_kind k, const string& d)
    {
      throw failure (k, "unable to sign assertion: " + d);
    };

    // Sign the message using openssl.
    //
    //   openssl dgst -sha256 -sign <pkey>
    //
    // Note that RSA is indicated by the contents of the private key.
    //
    // Note that here we assume the message fits into the pipe buffer and
    // the diagnostics fits into the stderr pipe buffer and don't poll
    // stderr.
    //
    string sig; // Binary signature (openssl output).
    try
    {
      fdpipe errp (fdopen_pipe ()); // stderr pipe.

      openssl os (
        [this] (const char* args[], size_t n)
        {
          if (trace_ != nullptr)
            *trace_ << process_args {args, n};
        },
        path ("-"), // Read message from openssl::out.
        path ("-"), // Write output to openssl::in.
        process::pipe (errp.in.get (), move (errp.out)),
        process_env (options_.program),
        "dgst", options_.options, "-sha256", "-sign", id.private_key);

      ifdstream err (move (errp.in));

      read_status rs;
      try
      {
        // Note: re-open out so that it gets automatically closed on
        // exception.
        //
        ofdstream out (os.out.release ());
        out << m;
        out.close ();

        rs = read_output (os, os.in.release (), sig, timeout_, cancel_);
      }
      catch (const io_error& e)
      {
        // If the process exits with non-zero status, assume the IO error is
        // due to that and fall through.
        //
        if (os.wait ())
          fail (failure_kind::signing_failure,
                string ("unable to read/write openssl stdout/stdin: ") +
                e.what ());

        rs = read_status::complete;
      }

      switch (rs)
      {
      case read_status::complete: break;
      case read_status::cancelled:
        throw failure (failure_kind::cancelled, "signing cancelled");
      case read_status::timeout:
        fail (failure_kind::transport_failure, "openssl execution timeout");
      }

      if (!os.wait ())
      {
        string et (err.read_text ());
        fail (failure_kind::signing_failure,
              "non-zero openssl exit status: " + et);
      }

      err.close ();
    }
    catch (const process_error& e)
    {
      fail (failure_kind::signing_failure,
            string ("unable to execute openssl: ") + e.what ());
    }
    catch (const io_error& e)
    {
      // Unable to read diagnostics from stderr.
      //
      fail (failure_kind::signing_failure,
            string ("unable to read openssl stderr: ") + e.what ());
    }

    if (sig.empty ())
      fail (failure_kind::signing_failure, "empty openssl output");

    r.token = jwt_token (m, vector<char> (sig.begin (), sig.end ()));
    return r;
  }
}
