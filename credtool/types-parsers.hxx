// file      : credtool/types-parsers.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

// CLI parsers, included into the generated source files.
//

#ifndef CREDTOOL_TYPES_PARSERS_HXX
#define CREDTOOL_TYPES_PARSERS_HXX

#include <credtool/options-types.hxx>

namespace cli
{
  class scanner;

  template <typename T>
  struct parser;

  template <>
  struct parser<credtool::path>
  {
    static void
    parse (credtool::path&, bool&, scanner&);
  };

  template <>
  struct parser<credtool::deployment_stage>
  {
    static void
    parse (credtool::deployment_stage&, bool&, scanner&);
  };

  template <>
  struct parser<credtool::fpga_target>
  {
    static void
    parse (credtool::fpga_target&, bool&, scanner&);
  };

  template <>
  struct parser<credtool::runner_scope>
  {
    static void
    parse (credtool::runner_scope&, bool&, scanner&);
  };

  template <>
  struct parser<credtool::destination>
  {
    static void
    parse (credtool::destination&, bool&, scanner&);
  };
}

#endif // CREDTOOL_TYPES_PARSERS_HXX
