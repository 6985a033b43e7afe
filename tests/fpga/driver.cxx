// file      : tests/fpga/driver.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <cctype>   // isxdigit(), islower()
#include <iostream>

#include <libbutl/utility.hxx> // operator<<(ostream,exception)

#include <libcredtool/types.hxx>
#include <libcredtool/utility.hxx>

#include <libcredtool/fpga.hxx>

#undef NDEBUG
#include <cassert>

using namespace std;
using namespace credtool;

template <typename F>
static bool
throws (F&& f)
{
  try
  {
    f ();
    return false;
  }
  catch (const invalid_argument&)
  {
    return true;
  }
}

int
main ()
try
{
  // Stages.
  //
  assert (to_deployment_stage ("carl") == deployment_stage::carl);
  assert (to_deployment_stage ("STAGING") == deployment_stage::staging);
  assert (to_deployment_stage ("Prod") == deployment_stage::prod);
  assert (to_string (deployment_stage::staging) == "staging");

  assert (throws ([] {to_deployment_stage ("");}));
  assert (throws ([] {to_deployment_stage ("production");}));

  {
    optional<stage_preset> p (find_stage_preset (deployment_stage::prod));
    assert (p);
    assert (p->app_id == "379559");
    assert (p->installation_id == "40993215");
    assert (p->organization == "chipsalliance");

    p = find_stage_preset (deployment_stage::carl);
    assert (p && p->organization == "clundin25-testorg");

    assert (!find_stage_preset (deployment_stage::staging));
  }

  // Targets and labels.
  //
  assert (to_fpga_target ("zcu104-nightly") == fpga_target::zcu104_nightly);
  assert (to_string (fpga_target::vck190) == "vck190");
  assert (throws ([] {to_fpga_target ("ZCU104");}));
  assert (throws ([] {to_fpga_target ("zcu102");}));

  assert ((fpga_runner_labels (fpga_target::zcu104, false) ==
           strings {"caliptra-fpga"}));

  assert ((fpga_runner_labels (fpga_target::zcu104, true) ==
           strings {"caliptra-fpga"}));

  assert ((fpga_runner_labels (fpga_target::zcu104_nightly, false) ==
           strings {"caliptra-fpga", "caliptra-fpga-nightly"}));

  assert ((fpga_runner_labels (fpga_target::vck190, false) ==
           strings {"vck190"}));

  assert ((fpga_runner_labels (fpga_target::vck190, true) ==
           strings {"vck190-staging"}));

  // Names.
  //
  assert (fpga_runner_name (fpga_target::zcu104, "kir", "3") ==
          "caliptra-fpga-kir-3");

  assert (fpga_runner_name (fpga_target::zcu104_nightly, "kir", "3") ==
          "caliptra-fpga-kir-3");

  assert (fpga_runner_name (fpga_target::vck190, "sjc", "b1") ==
          "vck190-sjc-b1");

  assert (throws ([] {fpga_runner_name (fpga_target::vck190, "", "1");}));
  assert (throws ([] {fpga_runner_name (fpga_target::vck190, "sjc", "");}));

  // Unique names: <name>-<16 hex digits>-<YYYY-MM-DD>.
  //
  {
    timestamp now (system_clock::now ());

    string n (unique_runner_name ("vck190-sjc-b1", now));
    string d (butl::to_string (now, "%Y-%m-%d", false, true));

    assert (d.size () == 10);
    assert (n.size () == 13 + 1 + 16 + 1 + 10);
    assert (n.compare (0, 14, "vck190-sjc-b1-") == 0);
    assert (n.compare (31, 10, d) == 0);
    assert (n[30] == '-');

    for (size_t i (14); i != 30; ++i)
    {
      char c (n[i]);
      assert (isxdigit (c) && !islower (c));
    }

    // The random parts of the two names differ (1 in 2^64 to fail).
    //
    assert (unique_runner_name ("vck190-sjc-b1", now) != n);
  }

  return 0;
}
catch (const std::exception& e)
{
  cerr << e << endl;
  return 1;
}
