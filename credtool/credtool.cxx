// file      : credtool/credtool.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <signal.h>

#include <cerrno>
#include <iostream>

#include <libbutl/pager.hxx>

#include <libcredtool/types.hxx>
#include <libcredtool/utility.hxx>

#include <libcredtool/fpga.hxx>
#include <libcredtool/clock.hxx>
#include <libcredtool/github.hxx>
#include <libcredtool/signer.hxx>
#include <libcredtool/delivery.hxx>
#include <libcredtool/diagnostics.hxx>
#include <libcredtool/orchestrator.hxx>
#include <libcredtool/token-exchanger.hxx>
#include <libcredtool/runner-token-requester.hxx>

#include <credtool/credtool-options.hxx>

using namespace std;
using namespace butl;

namespace credtool
{
  // Operation failed, diagnostics has already been issued.
  //
  struct failed {};

  static const char* help_info (
    "  info: run 'credtool --help' for more information");

  // Cancellation requested by SIGINT and SIGTERM.
  //
  static cancellation cancel;

  extern "C" void
  handle_signal (int)
  {
    cancel.cancel ();
  }

  static void
  log_write (diag_data&& d)
  {
    write_diag (cerr, d);
  }

  // Build the pipeline configuration from the command line options and the
  // stage preset, if any.
  //
  static orchestrator_config
  configure (const options& ops,
             const basic_mark& error,
             const basic_mark& info)
  {
    orchestrator_config r;

    optional<stage_preset> preset;

    if (ops.stage_specified ())
    {
      info << "running for stage " << ops.stage ();

      preset = find_stage_preset (ops.stage ());

      if (!preset && (!ops.app_id_specified ()          ||
                      !ops.installation_id_specified () ||
                      !ops.scope_specified ()))
      {
        error << "no preset for stage " << ops.stage () << ", --app-id, "
              << "--installation-id, and --scope must be specified";

        throw failed ();
      }
    }

    // Identity.
    //
    if (!ops.private_key_specified ())
    {
      error << "--private-key is expected";
      throw failed ();
    }

    r.app.private_key = ops.private_key ();

    if (ops.app_id_specified ())
      r.app.issuer = ops.app_id ();
    else if (preset)
      r.app.issuer = preset->app_id;
    else
    {
      error << "--app-id or --stage is expected";
      throw failed ();
    }

    if (ops.audience_specified ())
      r.app.audience = ops.audience ();

    if (ops.installation_id_specified ())
      r.installation.installation_id = ops.installation_id ();
    else if (preset)
      r.installation.installation_id = preset->installation_id;
    else
    {
      error << "--installation-id or --stage is expected";
      throw failed ();
    }

    // Runner.
    //
    runner_spec& rs (r.runner);

    if (ops.scope_specified ())
      rs.scope = ops.scope ();
    else if (preset)
      rs.scope = runner_scope ("org/" + preset->organization);
    else
    {
      error << "--scope or --stage is expected";
      throw failed ();
    }

    if (ops.runner_name_specified ())
      rs.name = ops.runner_name ();
    else if (ops.fpga_target_specified ())
    {
      if (!ops.location_specified () || !ops.fpga_identifier_specified ())
      {
        error << "--location and --fpga-identifier must be specified with "
              << "--fpga-target";

        throw failed ();
      }

      rs.name = fpga_runner_name (ops.fpga_target (),
                                  ops.location (),
                                  ops.fpga_identifier ());
    }
    else
    {
      error << "--runner-name or --fpga-target is expected";
      throw failed ();
    }

    if (ops.unique_suffix ())
      rs.name = unique_runner_name (rs.name, system_clock::now ());

    if (ops.fpga_target_specified ())
      rs.labels = fpga_runner_labels (ops.fpga_target (), ops.dry_run ());

    for (const string& l: ops.label ())
    {
      if (find (rs.labels.begin (), rs.labels.end (), l) == rs.labels.end ())
        rs.labels.push_back (l);
    }

    if (rs.labels.empty ())
    {
      error << "--label or --fpga-target is expected";
      throw failed ();
    }

    // Output.
    //
    r.output = ops.output ();

    if (ops.runner_arg_specified ())
    {
      if (r.output.kind != destination::program)
      {
        error << "--runner-arg specified without exec: output";
        throw failed ();
      }

      r.output.arguments = ops.runner_arg ();
    }

    // Timing.
    //
    if (ops.timeout () == 0)
    {
      error << "--timeout value must be positive";
      throw failed ();
    }

    if (ops.jit_validity () == 0)
    {
      error << "--jit-validity value must be positive";
      throw failed ();
    }

    r.jwt_validity = chrono::seconds (ops.jwt_validity ());

    r.retry.attempts = ops.retry_attempts ();
    r.retry.delay = chrono::milliseconds (ops.retry_delay ());
    r.retry.max_delay = chrono::milliseconds (ops.retry_max_delay ());
    r.retry.jitter = !ops.no_jitter ();

    return r;
  }

  static int
  main (int argc, char* argv[])
  try
  {
    cli::argv_file_scanner scan (argc, argv, "--options-file");
    options ops (scan);

    // Version.
    //
    if (ops.version ())
    {
      cout << "credtool " << CREDTOOL_VERSION_ID << endl
           << "libcredtool " << LIBCREDTOOL_VERSION_ID << endl
           << "libbutl " << LIBBUTL_VERSION_ID << endl
           << "Copyright (c) " << CREDTOOL_COPYRIGHT << "." << endl
           << "This is free software released under the MIT license." << endl;

      return 0;
    }

    // Help.
    //
    if (ops.help ())
    {
      pager p ("credtool help",
               false,
               ops.pager_specified () ? &ops.pager () : nullptr,
               &ops.pager_option ());

      print_usage (p.stream ());

      // If the pager failed, assume it has issued some diagnostics.
      //
      return p.wait () ? 0 : 1;
    }

    if (scan.more ())
      throw cli::unknown_argument (scan.next ());

    const diag_epilogue log_writer (&log_write);

    const basic_mark error (severity::error, log_writer);
    const basic_mark info  (severity::info,  log_writer);
    const basic_mark trace (severity::trace, log_writer, "credtool");

    orchestrator_config cfg (configure (ops, error, info));

    // Note that the API URL must end with a slash.
    //
    github_api api;
    api.url = ops.api_url ();
    api.timeout = chrono::seconds (ops.timeout ());

    if (api.url.empty ())
    {
      error << "empty --api-url value";
      return 1;
    }

    if (api.url.back () != '/')
      api.url += '/';

    real_clock clock;

    if (signal (SIGINT, &handle_signal) == SIG_ERR ||
        signal (SIGTERM, &handle_signal) == SIG_ERR)
    {
      error << "unable to set signal handler: "
            << system_error (errno, generic_category ()).what ();
      return 1;
    }

    // Trace the stage internals (executed commands, etc) at level 3.
    //
    const basic_mark* tr (ops.verbose () >= 3 ? &trace : nullptr);

    openssl_options oo;
    oo.program = ops.openssl ();
    oo.options = ops.openssl_option ();

    openssl_signer s (oo,
                      clock,
                      cancel,
                      api.timeout,
                      chrono::seconds (ops.jwt_backdate ()),
                      tr);

    github_token_exchanger e (api, clock, cancel, tr);

    github_runner_token_requester r (api,
                                     clock,
                                     cancel,
                                     chrono::seconds (ops.jit_validity ()),
                                     ops.runner_group (),
                                     ops.work_folder (),
                                     tr);

    orchestrator o (cfg, s, e, r, clock, cancel, cout, log_writer,
                    ops.verbose ());

    return o.run ();
  }
  catch (const cli::exception& e)
  {
    cerr << "error: " << e << endl << help_info << endl;
    return 1;
  }
  catch (const invalid_argument& e)
  {
    cerr << "error: " << e << endl;
    return 1;
  }
  catch (const failed&)
  {
    return 1; // Diagnostics has already been issued.
  }
}

int
main (int argc, char* argv[])
{
  return credtool::main (argc, argv);
}
