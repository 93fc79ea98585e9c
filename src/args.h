
#ifndef VOWELPAD_ARGS_H
#define VOWELPAD_ARGS_H

/** Command line parsing by popping words off argv.

  Options and commands are both words, matched through chained cases:

    args
      .case_("dry", g_dry_run)            // flag, takes no value
      .case_("brightness", g_brightness)  // double, takes one number
      .case_("config", g_config_filename) // string, takes one word
      .default_break_else_repeat();       // consume options until no match

    args
      .case_("apply", run_apply)          // run_apply(args) pops its own args
      .default_error();                   // exactly one command is required

  Malformed input is a usage error: help is printed and the program exits 1.
  Integers are counts, slots or milliseconds, so they must be nonnegative.
*/

#include "common.h"
#include <map>

class Args
{
  int m_argc;
  char ** m_argv;
  const char * const m_help;

public:

  typedef void (* Command)(Args &);

  class Action
  {
    enum Type { NONE, COMMAND, INT, DOUBLE, STRING, FLAG };

    Type m_type;
    Command m_command;
    int * m_int;
    double * m_double;
    string * m_string;
    bool * m_flag;

    void clear ()
    {
      m_command = NULL;
      m_int = NULL;
      m_double = NULL;
      m_string = NULL;
      m_flag = NULL;
    }

  public:

    Action ()              : m_type(NONE)    { clear(); }
    Action (Command c)     : m_type(COMMAND) { clear(); m_command = c; }
    Action (int & i)       : m_type(INT)     { clear(); m_int = & i; }
    Action (double & d)    : m_type(DOUBLE)  { clear(); m_double = & d; }
    Action (string & s)    : m_type(STRING)  { clear(); m_string = & s; }
    Action (bool & b)      : m_type(FLAG)    { clear(); m_flag = & b; }

    void operator() (Args & args) const;
  };

  class Switch
  {
    typedef std::map<string, Action> Cases;

    Args & m_args;
    Cases m_cases;

  public:

    Switch (Args & args) : m_args(args), m_cases() {}

    Switch & case_ (string word, Action action)
    {
      m_cases[word] = action;
      return * this;
    }

    // runs matching words until a word does not match
    void default_break_else_repeat ();

    // runs exactly one word, which must match
    void default_error ();

  private:

    void print_cases () const;
  };

  Args (int argc, char ** argv, const char * help);
  ~Args ();

  size_t size () const { return m_argc; }
  const char * top () const { return m_argc ? * m_argv : NULL; }

  const char * pop ();
  const char * pop (const char * default_value);
  double pop_double ();
  int pop_nonneg ();
  int pop_nonneg (int default_value);

  Switch case_ (string word, Action action);

  // these return false and leave value untouched on malformed input
  static bool parse_double (const char * arg, double & value);
  static bool parse_nonneg (const char * arg, int & value);

private:

  void usage_error (string message) const;
};

#endif // VOWELPAD_ARGS_H
