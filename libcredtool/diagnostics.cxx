// file      : libcredtool/diagnostics.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libcredtool/diagnostics.hxx>

using namespace std;

namespace credtool
{
  ostream&
  operator<< (ostream& os, severity s)
  {
    switch (s)
    {
    case severity::error:   os << "error";   break;
    case severity::warning: os << "warning"; break;
    case severity::info:    os << "info";    break;
    case severity::trace:   os << "trace";   break;
    }

    return os;
  }

  diag_record::
  ~diag_record () noexcept(false)
  {
    // Don't flush the record if this destructor was called as part of
    // the stack unwinding.
    //
    if (!data_.empty () && uncaught_ == uncaught_exceptions ())
    {
      data_.back ().msg = os_.str (); // Save last message.

      assert (epilogue_ != nullptr);
      (*epilogue_) (move (data_)); // Can throw.
    }
  }

#ifdef __GLIBCXX__
  diag_record::
  diag_record (diag_record&& r)
      : uncaught_ (r.uncaught_),
        data_ (move (r.data_)),
        epilogue_ (r.epilogue_)
  {
    if (!data_.empty ())
      os_ << r.os_.str ();

    r.data_.clear (); // Empty.
  }
#endif

  void
  write_diag (ostream& os, const diag_data& d)
  {
    for (const diag_entry& e: d)
    {
      os << e.sev << ": ";

      if (e.sev == severity::trace && e.name != nullptr)
        os << e.name << ": ";

      os << e.msg << endl;
    }
  }
}
