// file      : libcredtool/fpga.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libcredtool/fpga.hxx>

#include <random>

using namespace std;

namespace credtool
{
  static thread_local mt19937 rand_gen (random_device {} ());

  // deployment_stage
  //
  string
  to_string (deployment_stage s)
  {
    switch (s)
    {
    case deployment_stage::carl:    return "carl";
    case deployment_stage::staging: return "staging";
    case deployment_stage::prod:    return "prod";
    }

    return string (); // Should never reach.
  }

  deployment_stage
  to_deployment_stage (const string& s)
  {
         if (icasecmp (s, "carl") == 0)    return deployment_stage::carl;
    else if (icasecmp (s, "staging") == 0) return deployment_stage::staging;
    else if (icasecmp (s, "prod") == 0)    return deployment_stage::prod;
    else throw invalid_argument ("invalid stage '" + s + "', must be one " +
                                 "of 'carl', 'staging', or 'prod'");
  }

  optional<stage_preset>
  find_stage_preset (deployment_stage s)
  {
    switch (s)
    {
    case deployment_stage::carl:
      return stage_preset {"1160975", "61798278", "clundin25-testorg"};
    case deployment_stage::prod:
      return stage_preset {"379559", "40993215", "chipsalliance"};
    case deployment_stage::staging:
      break;
    }

    return nullopt;
  }

  // fpga_target
  //
  string
  to_string (fpga_target t)
  {
    switch (t)
    {
    case fpga_target::zcu104:         return "zcu104";
    case fpga_target::zcu104_nightly: return "zcu104-nightly";
    case fpga_target::vck190:         return "vck190";
    }

    return string (); // Should never reach.
  }

  fpga_target
  to_fpga_target (const string& t)
  {
         if (t == "zcu104")         return fpga_target::zcu104;
    else if (t == "zcu104-nightly") return fpga_target::zcu104_nightly;
    else if (t == "vck190")         return fpga_target::vck190;
    else throw invalid_argument ("invalid FPGA target '" + t + "', must be " +
                                 "one of 'zcu104', 'zcu104-nightly', or " +
                                 "'vck190'");
  }

  string
  fpga_board (fpga_target t)
  {
    switch (t)
    {
    case fpga_target::zcu104:
    case fpga_target::zcu104_nightly: return "caliptra-fpga";
    case fpga_target::vck190:         return "vck190";
    }

    return string (); // Should never reach.
  }

  strings
  fpga_runner_labels (fpga_target t, bool dry_run)
  {
    switch (t)
    {
    case fpga_target::zcu104:
      return strings {"caliptra-fpga"};
    case fpga_target::zcu104_nightly:
      return strings {"caliptra-fpga", "caliptra-fpga-nightly"};
    case fpga_target::vck190:
      return strings {dry_run ? "vck190-staging" : "vck190"};
    }

    return strings (); // Should never reach.
  }

  string
  fpga_runner_name (fpga_target t, const string& l, const string& i)
  {
    if (l.empty ())
      throw invalid_argument ("empty runner location");

    if (i.empty ())
      throw invalid_argument ("empty FPGA identifier");

    return fpga_board (t) + '-' + l + '-' + i;
  }

  string
  unique_runner_name (const string& n, timestamp now)
  {
    string r (n);
    r += '-';

    uniform_int_distribution<unsigned int> d (0, 15);
    for (size_t i (0); i != 16; ++i)
      r += "0123456789ABCDEF"[d (rand_gen)];

    r += '-';
    r += butl::to_string (now,
                          "%Y-%m-%d",
                          false /* special */,
                          true  /* local */);
    return r;
  }
}
