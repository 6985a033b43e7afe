// file      : libcredtool/fpga.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LIBCREDTOOL_FPGA_HXX
#define LIBCREDTOOL_FPGA_HXX

#include <libcredtool/types.hxx>
#include <libcredtool/utility.hxx>

namespace credtool
{
  // Deployment stage of the CI fleet the runners are registered for.
  //
  enum class deployment_stage: uint8_t
  {
    carl,
    staging,
    prod
  };

  string
  to_string (deployment_stage);

  // Throw invalid_argument if the argument is not a valid stage name. The
  // name is case-insensitive.
  //
  deployment_stage
  to_deployment_stage (const string&);

  inline ostream&
  operator<< (ostream& os, deployment_stage s)
  {
    return os << to_string (s);
  }

  // The App and its installation the stage is served by.
  //
  struct stage_preset
  {
    string app_id;
    string installation_id;
    string organization;
  };

  // Return nullopt if there is no preset for the stage.
  //
  optional<stage_preset>
  find_stage_preset (deployment_stage);

  // FPGA board the runner is attached to.
  //
  enum class fpga_target: uint8_t
  {
    zcu104,
    zcu104_nightly,
    vck190
  };

  string
  to_string (fpga_target);

  fpga_target
  to_fpga_target (const string&); // May throw invalid_argument.

  inline ostream&
  operator<< (ostream& os, fpga_target t)
  {
    return os << to_string (t);
  }

  // Board type used as the runner name prefix.
  //
  string
  fpga_board (fpga_target);

  // Return the runner labels the jobs target the board with. For the dry
  // run the staging labels are returned where they differ.
  //
  strings
  fpga_runner_labels (fpga_target, bool dry_run);

  // Return the runner name in the `<board>-<location>-<identifier>` form.
  // The location is the physical location of the host (for example, "kir")
  // and the identifier differentiates the boards at the location.
  //
  // Throw invalid_argument if the location or identifier is empty.
  //
  string
  fpga_runner_name (fpga_target,
                    const string& location,
                    const string& identifier);

  // Append the `-<hex>-<date>` suffix to the runner name, where <hex> is 16
  // random uppercase hexadecimal digits and <date> is the local date in the
  // YYYY-MM-DD form. This way a runner that crashed without deregistering
  // doesn't block the host re-registration.
  //
  string
  unique_runner_name (const string& name, timestamp now);
}

#endif // LIBCREDTOOL_FPGA_HXX
