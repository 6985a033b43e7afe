// file      : libcredtool/delivery.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libcredtool/delivery.hxx>

#include <libbutl/process.hxx>
#include <libbutl/fdstream.hxx>
#include <libbutl/filesystem.hxx> // auto_rmfile, mventry()
#include <libbutl/process-io.hxx> // operator<<(ostream, process_exit)

#include <sstream>

using namespace std;
using namespace butl;

namespace credtool
{
  // destination
  //
  destination::
  destination (const string& s)
  {
    auto value = [&s] (size_t n) -> path
    {
      string v (s, n);

      if (v.empty ())
        throw invalid_argument ("empty path in destination '" + s + '\'');

      try
      {
        return path (move (v));
      }
      catch (const invalid_path& e)
      {
        throw invalid_argument ("invalid path '" + e.path + "' in " +
                                "destination '" + s + '\'');
      }
    };

    if (s == "stdout")
      kind = standard_output;
    else if (s.compare (0, 5, "file:") == 0)
    {
      kind = file;
      target = value (5);
    }
    else if (s.compare (0, 5, "exec:") == 0)
    {
      kind = program;
      target = value (5);
    }
    else
      throw invalid_argument ("invalid destination '" + s + "', expected " +
                              "stdout, file:<path>, or exec:<program>");
  }

  string
  to_string (const destination& d)
  {
    switch (d.kind)
    {
    case destination::standard_output: return "stdout";
    case destination::file:             return "file:" + d.target.string ();
    case destination::program:          return "exec:" + d.target.string ();
    }

    return string (); // Should never reach.
  }

  void
  deliver_file (const string& v,
                const path& f,
                const function<void (const path&)>& written)
  {
    auto fail = [&f] (const string& d)
    {
      throw failure (failure_kind::delivery_failure,
                     "unable to write token to " + f.string () + ": " + d);
    };

    // Note that the temporary file name is unique per process so that the
    // concurrent deliveries to the same target don't clash. Also note that a
    // temporary file may be left behind if we are killed before the rename.
    //
    path tf (f + ".tmp." + to_string (process::current_id ()));

    try
    {
      auto_rmfile rm (tf);

      {
        ofdstream os (fdopen (tf,
                              fdopen_mode::out       |
                              fdopen_mode::create    |
                              fdopen_mode::exclusive |
                              fdopen_mode::binary,
                              permissions::ru | permissions::wu));

        os << v << '\n';
        os.close ();
      }

      if (written)
        written (tf);

      mventry (tf, f, cpflags::overwrite_content);
      rm.cancel ();
    }
    catch (const io_error& e)
    {
      fail (e.what ());
    }
    catch (const system_error& e) // mventry()
    {
      fail (e.what ());
    }
  }

  void
  deliver (const runner_registration_token& t,
           const destination& d,
           ostream& out,
           const basic_mark* trace)
  {
    switch (d.kind)
    {
    case destination::standard_output:
      {
        // Note that the stream may or may not have the exceptions enabled.
        //
        try
        {
          out << t.token << endl;
        }
        catch (const io_error& e)
        {
          throw failure (failure_kind::delivery_failure,
                         string ("unable to write token to stdout: ") +
                         e.what ());
        }

        if (!out)
          throw failure (failure_kind::delivery_failure,
                         "unable to write token to stdout");

        break;
      }
    case destination::file:
      {
        deliver_file (t.token, d.target);
        break;
      }
    case destination::program:
      {
        auto fail = [&d] (const string& m)
        {
          throw failure (failure_kind::delivery_failure,
                         "runner program " + d.target.string () + ' ' + m);
        };

        try
        {
          // Note that the token is not printed to the trace.
          //
          if (trace != nullptr)
          {
            diag_record dr (*trace);
            dr << "executing " << d.target;

            for (const string& a: d.arguments)
              dr << ' ' << a;

            dr << " --jitconfig <token>";
          }

          // Inherit stdin/stdout/stderr.
          //
          process pr (process_start (0, 1, 2,
                                     process_env (d.target),
                                     d.arguments,
                                     "--jitconfig", t.token));

          if (!pr.wait ())
          {
            assert (pr.exit);

            ostringstream os;
            os << *pr.exit;
            fail (os.str ());
          }
        }
        catch (const process_error& e)
        {
          fail (string ("execution failed: ") + e.what ());
        }

        break;
      }
    }
  }
}
