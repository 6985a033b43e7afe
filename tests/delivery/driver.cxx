// file      : tests/delivery/driver.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <chrono>
#include <random>
#include <thread>   // this_thread::sleep_for()
#include <sstream>
#include <streambuf>
#include <iostream>

#include <libbutl/process.hxx>
#include <libbutl/utility.hxx>    // operator<<(ostream,exception)
#include <libbutl/fdstream.hxx>
#include <libbutl/filesystem.hxx>

#include <libcredtool/types.hxx>
#include <libcredtool/utility.hxx>

#include <libcredtool/failure.hxx>
#include <libcredtool/delivery.hxx>
#include <libcredtool/credentials.hxx>

#undef NDEBUG
#include <cassert>

using namespace std;
using namespace butl;
using namespace credtool;

static string
read_file (const path& f)
{
  ifdstream is (f);
  string r (is.read_text ());
  is.close ();
  return r;
}

static void
write_file (const path& f, const string& s)
{
  ofdstream os (f);
  os << s;
  os.close ();
}

static bool
bad_destination (const string& s)
{
  try
  {
    destination d (s);
    return false;
  }
  catch (const invalid_argument&)
  {
    return true;
  }
}

static runner_registration_token
token (const string& v)
{
  runner_registration_token r;
  r.token = v;
  r.expires_at = system_clock::now () + chrono::hours (1);
  r.runner_name = "fpga-runner-07";
  r.labels = strings {"fpga", "caliptra"};
  return r;
}

// Return the directory entry names.
//
// Stream buffer that fails every write, as /dev/full does.
//
struct full_buffer: std::streambuf
{
  virtual int_type
  overflow (int_type) override {return traits_type::eof ();}
};

// Return true if delivering to stdout via the stream fails with
// delivery_failure.
//
static bool
unwritable (ostream& os)
{
  try
  {
    deliver (token ("stdout-token"), destination (), os);
    return false;
  }
  catch (const failure& e)
  {
    assert (e.kind == failure_kind::delivery_failure);
    assert (string (e.what ()).find ("stdout-token") == string::npos);
    return true;
  }
}

static strings
entries (const dir_path& d)
{
  strings r;
  for (const dir_entry& de: dir_iterator (d, dir_iterator::ignore_dangling))
    r.push_back (de.path ().string ());
  return r;
}

// Usage: argv[0] [(stall|loop) <file> | runner <token> <args>...]
//
// Without arguments, run the tests re-invoking itself to simulate a process
// killed in the middle of the delivery:
//
// stall   deliver the token to the file, announcing on stdout that it is
//         written to the temporary file, and hang before the rename
//
// loop    deliver the large tokens to the file in an infinite loop
//
// runner  act as the runner program, exit with zero code if the arguments
//         end with --jitconfig <token>
//
int
main (int argc, char* argv[])
try
{
  if (argc > 1)
  {
    string m (argv[1]);

    if (m == "runner")
    {
      assert (argc >= 3);
      return argc >= 5                              &&
             string (argv[argc - 2]) == "--jitconfig" &&
             string (argv[argc - 1]) == argv[2]
             ? 0
             : 1;
    }

    assert (argc == 3);
    path f (argv[2]);

    if (m == "stall")
    {
      deliver_file ("new-token",
                    f,
                    [] (const path&)
                    {
                      cout << "ready" << endl;

                      for (;;)
                        this_thread::sleep_for (chrono::seconds (1));
                    });
    }
    else if (m == "loop")
    {
      for (size_t i (0);; ++i)
        deliver_file (string (1024 * 1024, i % 2 == 0 ? 'a' : 'b'), f);
    }
    else
      assert (false);

    return 0;
  }

  dir_path td (dir_path::temp_path ("credtool-delivery"));
  try_mkdir_p (td);
  auto_rmdir rm (td);

  // Destination parsing.
  //
  {
    assert (destination ("stdout").kind == destination::standard_output);

    destination f ("file:/run/runner/token");
    assert (f.kind == destination::file);
    assert (f.target == path ("/run/runner/token"));
    assert (to_string (f) == "file:/run/runner/token");

    destination e ("exec:./run.sh");
    assert (e.kind == destination::program);
    assert (e.target == path ("./run.sh"));

    assert (bad_destination (""));
    assert (bad_destination ("stderr"));
    assert (bad_destination ("file:"));
    assert (bad_destination ("exec:"));
    assert (bad_destination ("ftp:host"));
  }

  // Standard output.
  //
  {
    ostringstream os;
    deliver (token ("stdout-token"), destination (), os);
    assert (os.str () == "stdout-token\n");
  }

  // Unwritable standard output is a failure whether or not the stream has
  // the exceptions enabled.
  //
  {
    ostream os (nullptr);
    assert (unwritable (os));
  }

  {
    full_buffer b;
    ostream os (&b);
    assert (unwritable (os));
  }

  {
    full_buffer b;
    ostream os (&b);
    os.exceptions (ostream::badbit | ostream::failbit);
    assert (unwritable (os));
  }

  // New file is written with the owner-only permissions.
  //
  path f (td / "token");
  {
    deliver (token ("first-token"), destination ("file:" + f.string ()), cout);

    assert (read_file (f) == "first-token\n");
    assert (path_permissions (f) == (permissions::ru | permissions::wu));
    assert (entries (td).size () == 1); // No temporary files left.
  }

  // Existing file is replaced and its permissions are tightened.
  //
  {
    write_file (f, "old\n");
    path_permissions (f,
                      permissions::ru | permissions::wu |
                      permissions::rg | permissions::ro);

    deliver (token ("second-token"), destination ("file:" + f.string ()), cout);

    assert (read_file (f) == "second-token\n");
    assert (path_permissions (f) == (permissions::ru | permissions::wu));
    assert (entries (td).size () == 1);
  }

  // Failures leave the target untouched and no temporary files behind.
  //
  {
    dir_path d (td / dir_path ("dir"));
    try_mkdir (d);

    try
    {
      deliver_file ("token", path (d.string ()));
      assert (false);
    }
    catch (const failure& e)
    {
      assert (e.kind == failure_kind::delivery_failure);
      assert (string (e.what ()).find ("token\n") == string::npos);
    }

    assert (dir_exists (d));
    assert (entries (td).size () == 2);

    try
    {
      deliver (token ("token"),
               destination ("file:" + (td / "missing" / "token").string ()),
               cout);
      assert (false);
    }
    catch (const failure& e)
    {
      assert (e.kind == failure_kind::delivery_failure);
    }

    assert (entries (td).size () == 2);

    rmdir (d);
  }

  // Process killed after the token is written to the temporary file but
  // before it is renamed: the target still contains the previous token.
  //
  {
    write_file (f, "old\n");

    process pr (process_start (0, -1, 2,
                               process_env (path (argv[0])),
                               "stall", f));

    ifdstream is (move (pr.in_ofd));

    string l;
    getline (is, l);
    assert (l == "ready");

    pr.kill ();
    assert (!pr.wait ());
    is.close ();

    assert (read_file (f) == "old\n");
  }

  // Process killed at random points while repeatedly delivering: the target
  // always contains either the previous or a complete new token.
  //
  {
    mt19937 g (random_device {} ());
    uniform_int_distribution<int> delay (0, 50);

    const size_t n (1024 * 1024);

    for (size_t i (0); i != 20; ++i)
    {
      write_file (f, "old\n");

      process pr (process_start (0, 1, 2,
                                 process_env (path (argv[0])),
                                 "loop", f));

      this_thread::sleep_for (chrono::milliseconds (delay (g)));

      pr.kill ();
      assert (!pr.wait ());

      string s (read_file (f));

      if (s != "old\n")
      {
        assert (s.size () == n + 1);
        assert (s.back () == '\n');
        assert (s.find_first_not_of (s[0]) == n);
      }
    }
  }

  // Handing the token over to the runner program.
  //
  {
    destination d ("exec:" + string (argv[0]));
    d.arguments = strings {"runner", "exec-token", "--url", "https://x"};

    deliver (token ("exec-token"), d, cout);

    d.arguments = strings {"runner", "other-token"};

    try
    {
      deliver (token ("exec-token"), d, cout);
      assert (false);
    }
    catch (const failure& e)
    {
      assert (e.kind == failure_kind::delivery_failure);
      assert (string (e.what ()).find ("exec-token") == string::npos);
    }

    try
    {
      deliver (token ("exec-token"),
               destination ("exec:" + (td / "no-such-runner").string ()),
               cout);
      assert (false);
    }
    catch (const failure& e)
    {
      assert (e.kind == failure_kind::delivery_failure);
    }
  }

  return 0;
}
catch (const failure& e)
{
  cerr << e << endl;
  return 1;
}
catch (const io_error& e)
{
  cerr << e << endl;
  return 1;
}
catch (const process_error& e)
{
  cerr << e << endl;
  return 1;
}
catch (const system_error& e)
{
  cerr << e << endl;
  return 1;
}
