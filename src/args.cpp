
#include "args.h"
#include <sstream>
#include <cctype>
#include <climits>
#include <cerrno>

//----( actions )-------------------------------------------------------------

void Args::Action::operator() (Args & args) const
{
  switch (m_type) {
    case NONE: break;
    case COMMAND: m_command(args); break;
    case INT: * m_int = args.pop_nonneg(); break;
    case DOUBLE: * m_double = args.pop_double(); break;
    case STRING: * m_string = args.pop(); break;
    case FLAG: * m_flag = true; break;
  }
}

//----( switches )------------------------------------------------------------

void Args::Switch::print_cases () const
{
  std::ostringstream words;
  for (Cases::const_iterator i = m_cases.begin(); i != m_cases.end(); ++i) {
    words << " " << i->first;
  }
  LOG("try one of:" << words.str());
}

void Args::Switch::default_break_else_repeat ()
{
  while (const char * word = m_args.top()) {
    Cases::const_iterator i = m_cases.find(word);
    if (i == m_cases.end()) return;

    m_args.pop();
    i->second(m_args);
  }
}

void Args::Switch::default_error ()
{
  if (not m_args.size()) {
    LOG(m_args.m_help);
    LOG("ERROR missing command");
    print_cases();
    exit(1);
  }

  string word = m_args.pop();
  Cases::const_iterator i = m_cases.find(word);
  if (i == m_cases.end()) {
    LOG(m_args.m_help);
    LOG("ERROR unknown command: " << word);
    print_cases();
    exit(1);
  }

  i->second(m_args);
}

//----( popping )-------------------------------------------------------------

Args::Args (int argc, char ** argv, const char * help)
  : m_argc(argc - 1),
    m_argv(argv + 1),
    m_help(help)
{}

Args::~Args ()
{
  if (m_argc) {
    std::ostringstream unused;
    while (m_argc) unused << " " << pop();
    WARN("unused arguments:" << unused.str());
  }
}

void Args::usage_error (string message) const
{
  LOG(m_help);
  LOG("ERROR " << message);
  exit(1);
}

const char * Args::pop ()
{
  if (not m_argc) usage_error("too few arguments");

  --m_argc;
  return * (m_argv++);
}

const char * Args::pop (const char * default_value)
{
  return m_argc ? pop() : default_value;
}

double Args::pop_double ()
{
  const char * arg = pop();
  double value = 0;
  if (not parse_double(arg, value)) {
    usage_error(string("expected a number, got ") + arg);
  }
  return value;
}

int Args::pop_nonneg ()
{
  const char * arg = pop();
  int value = 0;
  if (not parse_nonneg(arg, value)) {
    usage_error(string("expected a nonnegative integer, got ") + arg);
  }
  return value;
}

int Args::pop_nonneg (int default_value)
{
  return m_argc ? pop_nonneg() : default_value;
}

Args::Switch Args::case_ (string word, Action action)
{
  Switch result(* this);
  result.case_(word, action);
  return result;
}

//----( parsing )-------------------------------------------------------------

bool Args::parse_double (const char * arg, double & value)
{
  char * end = NULL;
  errno = 0;
  double result = strtod(arg, & end);

  if (end == arg or * end) return false;
  if (errno == ERANGE or not safe_isfinite(result)) return false;

  value = result;
  return true;
}

bool Args::parse_nonneg (const char * arg, int & value)
{
  if (not * arg) return false;
  for (const char * c = arg; * c; ++c) {
    if (not isdigit(static_cast<unsigned char>(* c))) return false;
  }

  errno = 0;
  long result = strtol(arg, NULL, 10);
  if (errno == ERANGE or result > INT_MAX) return false;

  value = result;
  return true;
}
