// file      : libcredtool/credentials.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libcredtool/credentials.hxx>

#include <cctype> // isspace(), iscntrl()

using namespace std;
using namespace butl;

namespace credtool
{
  // Return true if the scope component is a valid GitHub account or
  // repository name.
  //
  static bool
  valid_component (const string& s)
  {
    if (s.empty () || s == "." || s == "..")
      return false;

    for (char c: s)
    {
      if (!(isalnum (static_cast<unsigned char> (c)) ||
            c == '-' || c == '_' || c == '.'))
        return false;
    }

    return true;
  }

  // runner_scope
  //
  runner_scope::
  runner_scope (const string& s)
  {
    auto bad = [&s] (const char* what)
    {
      throw invalid_argument ("invalid runner scope '" + s + "': " + what);
    };

    size_t p (s.find ('/'));
    if (p == string::npos)
      bad ("expected org/<organization> or repo/<owner>/<repository>");

    string k (s, 0, p);

    if (k == "org")
    {
      kind = organization;
      owner = string (s, p + 1);

      if (!valid_component (owner))
        bad ("invalid organization name");
    }
    else if (k == "repo")
    {
      kind = repository;

      size_t n (s.find ('/', p + 1));
      if (n == string::npos)
        bad ("expected repo/<owner>/<repository>");

      owner = string (s, p + 1, n - p - 1);
      repository = string (s, n + 1);

      if (!valid_component (owner))
        bad ("invalid repository owner");

      if (!valid_component (repository))
        bad ("invalid repository name");
    }
    else
      bad ("unknown scope kind '" + k + "', expected 'org' or 'repo'");
  }

  string
  to_string (const runner_scope& s)
  {
    return s.kind == runner_scope::organization
      ? "org/" + s.owner
      : "repo/" + s.owner + '/' + s.repository;
  }

  void
  validate (const runner_spec& r)
  {
    if (r.name.empty ())
      throw invalid_argument ("empty runner name");

    if (r.name.size () > 64)
      throw invalid_argument ("runner name '" + r.name + "' is longer than " +
                              "64 characters");

    for (char c: r.name)
    {
      if (isspace (static_cast<unsigned char> (c)) ||
          iscntrl (static_cast<unsigned char> (c)))
        throw invalid_argument ("invalid runner name '" + r.name + '\'');
    }

    if (r.labels.empty ())
      throw invalid_argument ("no labels specified for runner '" + r.name +
                              '\'');

    for (auto i (r.labels.begin ()); i != r.labels.end (); ++i)
    {
      if (i->empty ())
        throw invalid_argument ("empty runner label");

      if (find (r.labels.begin (), i, *i) != i)
        throw invalid_argument ("duplicate runner label '" + *i + '\'');
    }

    // Note: the default-constructed scope has an empty owner.
    //
    if (r.scope.owner.empty ())
      throw invalid_argument ("no runner scope specified");
  }

  ostream&
  operator<< (ostream& os, const signed_assertion& a)
  {
    os << "issuer: " << a.issuer
       << ", audience: " << (a.audience ? *a.audience : "null")
       << ", issued_at: ";
    butl::operator<< (os, a.issued_at);
    os << ", expires_at: ";
    butl::operator<< (os, a.expires_at);
    os << ", nonce: " << a.nonce
       << ", token: <" << a.token.size () << " bytes>";

    return os;
  }

  ostream&
  operator<< (ostream& os, const scoped_access_credential& c)
  {
    os << "token: <" << c.token.size () << " bytes>, expires_at: ";
    butl::operator<< (os, c.expires_at);
    os << ", installation: " << c.scope.installation_id
       << ", repository_selection: "
       << (c.repository_selection ? *c.repository_selection : "null");

    return os;
  }

  ostream&
  operator<< (ostream& os, const runner_spec& r)
  {
    os << "name: " << r.name << ", labels: [";

    for (size_t i (0); i != r.labels.size (); ++i)
      os << (i != 0 ? ", " : "") << r.labels[i];

    os << "], scope: " << r.scope;

    return os;
  }

  ostream&
  operator<< (ostream& os, const runner_registration_token& t)
  {
    os << "token: <" << t.token.size () << " bytes>, expires_at: ";
    butl::operator<< (os, t.expires_at);
    os << ", runner_id: ";

    if (t.runner_id)
      os << *t.runner_id;
    else
      os << "null";

    os << ", runner_name: " << t.runner_name;

    return os;
  }
}
