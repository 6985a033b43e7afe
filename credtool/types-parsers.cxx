// file      : credtool/types-parsers.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <credtool/types-parsers.hxx>

#include <credtool/credtool-options.hxx> // cli namespace

using namespace std;
using namespace credtool;

namespace cli
{
  void parser<path>::
  parse (path& x, bool& xs, scanner& s)
  {
    xs = true;
    const char* o (s.next ());

    if (!s.more ())
      throw missing_value (o);

    const char* v (s.next ());

    try
    {
      x = path (v);

      if (x.empty ())
        throw invalid_value (o, v);
    }
    catch (const invalid_path&)
    {
      throw invalid_value (o, v);
    }
  }

  // Parse the value using the T (const string&) function which throws
  // invalid_argument for the invalid representation.
  //
  template <typename T, typename F>
  static void
  parse_value (T& x, scanner& s, F f)
  {
    const char* o (s.next ());

    if (!s.more ())
      throw missing_value (o);

    const string v (s.next ());

    try
    {
      x = f (v);
    }
    catch (const invalid_argument& e)
    {
      throw invalid_value (o, v, e.what ());
    }
  }

  void parser<deployment_stage>::
  parse (deployment_stage& x, bool& xs, scanner& s)
  {
    xs = true;
    parse_value (x, s, to_deployment_stage);
  }

  void parser<fpga_target>::
  parse (fpga_target& x, bool& xs, scanner& s)
  {
    xs = true;
    parse_value (x, s, to_fpga_target);
  }

  void parser<runner_scope>::
  parse (runner_scope& x, bool& xs, scanner& s)
  {
    xs = true;
    parse_value (x, s, [] (const string& v) {return runner_scope (v);});
  }

  void parser<destination>::
  parse (destination& x, bool& xs, scanner& s)
  {
    xs = true;
    parse_value (x, s, [] (const string& v) {return destination (v);});
  }
}
