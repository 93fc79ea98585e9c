
#include "device.h"
#include <sstream>
#include <cstring>
#include <errno.h>
#include <sys/types.h>
#include <sys/wait.h>

#define COPY_SLOT_TEMP_FILE                  "_dpc_temp_copy"

namespace Device
{

//----( commands )------------------------------------------------------------

string KnobUpdate::str () const
{
  std::ostringstream o;
  o << *this;
  return o.str();
}

StateOp StateOp::dump_knobs (string file)
{
  return StateOp(DUMP_KNOBS, file, -1, -1);
}

StateOp StateOp::pump_knobs (string file)
{
  return StateOp(PUMP_KNOBS, file, -1, -1);
}

StateOp StateOp::dump_slot (int slot, string file)
{
  ASSERT_NONNEG(slot);
  return StateOp(DUMP_SLOT, file, slot, -1);
}

StateOp StateOp::pump_slot (string file, int slot)
{
  ASSERT_NONNEG(slot);
  return StateOp(PUMP_SLOT, file, slot, -1);
}

StateOp StateOp::copy_slot (int source, int target)
{
  ASSERT_NONNEG(source);
  ASSERT_NONNEG(target);
  return StateOp(COPY_SLOT, COPY_SLOT_TEMP_FILE, source, target);
}

ostream & operator<< (ostream & o, const StateOp & op)
{
  switch (op.type) {
    case StateOp::DUMP_KNOBS:
      return o << "dump knobs -> " << op.file;
    case StateOp::PUMP_KNOBS:
      return o << "pump knobs <- " << op.file;
    case StateOp::DUMP_SLOT:
      return o << "dump slot " << op.slot << " -> " << op.file << ".dlp";
    case StateOp::PUMP_SLOT:
      return o << "pump slot " << op.slot << " <- " << op.file << ".dlp";
    case StateOp::COPY_SLOT:
      return o << "copy slot " << op.slot << " -> slot " << op.target_slot;
  }
  return o << "unknown state op";
}

//----( d-lin subprocess )----------------------------------------------------

namespace
{

inline string to_string (int i)
{
  std::ostringstream o;
  o << i;
  return o.str();
}

std::vector<string> make_args (
    const char * a0,
    const char * a1,
    const char * a2,
    string a3)
{
  std::vector<string> args;
  args.push_back(a0);
  args.push_back(a1);
  args.push_back(a2);
  args.push_back(a3);
  return args;
}

std::vector<string> make_args (
    const char * a0,
    const char * a1,
    string a2,
    const char * a3,
    string a4)
{
  std::vector<string> args;
  args.push_back(a0);
  args.push_back(a1);
  args.push_back(a2);
  args.push_back(a3);
  args.push_back(a4);
  return args;
}

} // anonymous namespace

DlinChannel::DlinChannel (string command, bool use_sudo)
  : m_command(command),
    m_use_sudo(use_sudo),
    m_num_commands(0),
    m_num_failures(0)
{
  LOG("driving D-Lev via " << (use_sudo ? "sudo " : "") << command);
}

DlinChannel::~DlinChannel ()
{
  LOG(" d-lin ran " << m_num_commands << " commands, "
      << m_num_failures << " failed");
}

std::vector<string> DlinChannel::knob_args (const KnobUpdate & update)
{
  std::vector<string> args;
  args.push_back("knob");
  args.push_back("-pkv");
  args.push_back(update.str());
  return args;
}

std::vector<std::vector<string> > DlinChannel::state_args (const StateOp & op)
{
  std::vector<std::vector<string> > commands;

  switch (op.type) {
    case StateOp::DUMP_KNOBS:
      commands.push_back(make_args("dump", "-k", "-f", op.file));
      break;

    case StateOp::PUMP_KNOBS:
      commands.push_back(make_args("pump", "-k", "-f", op.file));
      break;

    case StateOp::DUMP_SLOT:
      commands.push_back(
          make_args("dump", "-s", to_string(op.slot), "-f", op.file));
      break;

    case StateOp::PUMP_SLOT:
      commands.push_back(
          make_args("pump", "-f", op.file, "-s", to_string(op.slot)));
      break;

    // d-lin has no slot-to-slot copy, so go through a temp .dlp file
    case StateOp::COPY_SLOT:
      commands.push_back(
          make_args("dump", "-s", to_string(op.slot), "-f", op.file));
      commands.push_back(
          make_args("pump", "-f", op.file, "-s", to_string(op.target_slot)));
      break;
  }

  return commands;
}

bool DlinChannel::send (const KnobUpdate & update)
{
  return run(knob_args(update));
}

bool DlinChannel::invoke (const StateOp & op)
{
  std::vector<std::vector<string> > commands = state_args(op);
  for (size_t i = 0; i < commands.size(); ++i) {
    if (not run(commands[i])) return false;
  }
  return true;
}

bool DlinChannel::run (const std::vector<string> & args)
{
  std::vector<string> argv_strings;
  if (m_use_sudo) argv_strings.push_back("sudo");
  argv_strings.push_back(m_command);
  argv_strings.insert(argv_strings.end(), args.begin(), args.end());

  std::ostringstream line;
  std::vector<char *> argv;
  for (size_t i = 0; i < argv_strings.size(); ++i) {
    line << (i ? " " : "") << argv_strings[i];
    argv.push_back(const_cast<char *>(argv_strings[i].c_str()));
  }
  argv.push_back(NULL);

  LOG(">> " << line.str());
  ++m_num_commands;

  int info = 0;
  pid_t pid = fork();
  switch (pid) {
    case -1:
      WARN("failed to fork " << argv_strings[0] << ": " << strerror(errno));
      ++m_num_failures;
      return false;

    case 0:
      execvp(argv[0], & argv[0]);
      cerr << "failed to exec " << argv[0] << ": " << strerror(errno) << endl;
      _exit(127);

    default:
      if (waitpid(pid, & info, 0) < 0) {
        WARN("failed to wait for " << argv_strings[0] << ": "
            << strerror(errno));
        ++m_num_failures;
        return false;
      }
  }

  if (not (WIFEXITED(info) and WEXITSTATUS(info) == 0)) {
    WARN(line.str() << " failed with status " << info);
    ++m_num_failures;
    return false;
  }

  return true;
}

//----( dry run )-------------------------------------------------------------

bool DryRunChannel::send (const KnobUpdate & update)
{
  if (m_verbose) LOG(">> (dry) knob -pkv " << update);
  m_sent.push_back(update);
  return not m_failing;
}

bool DryRunChannel::invoke (const StateOp & op)
{
  if (m_verbose) LOG(">> (dry) " << op);
  m_invoked.push_back(op);
  return not m_failing;
}

} // namespace Device

