
#ifndef VOWELPAD_CONFIG_H
#define VOWELPAD_CONFIG_H

/** Reads flat key = value config files.

  Lines starting with # are comments.
  Values are single whitespace-free tokens.
  A missing file is not fatal: every lookup then returns its default.
  Any value that differs from its default is logged when looked up.
*/

#include "common.h"
#include <unordered_map>
#include <fstream>
#include <cstdlib>
#include <cstdio>
#include <cctype>

class ConfigParser
{
  typedef std::unordered_map<string, string> Dict;
  typedef Dict::const_iterator Auto;
  Dict m_dict;
  const string m_filename;
  bool m_found;

public:

  ConfigParser (const char * filename)
    : m_filename(filename),
      m_found(false)
  {
    std::ifstream file(filename);
    if (not file) {
      LOG("no config file " << filename << ", using defaults");
      return;
    }
    m_found = true;

    string comment, key, equals, value;
    while (file) {
      int peek = file.peek();
      if (peek == EOF) {
        break;
      } else if (isspace(peek)) {
        file.get();
      } else if (peek == '#') {
        std::getline(file, comment);
      } else {
        file >> key >> equals >> value;
        ASSERTW(equals == "=", m_filename << ": expected '=' after " << key
                                          << ", found " << equals);
        if (equals == "=") m_dict[key] = value;
      }
    }
  }

  bool found () const { return m_found; }
  bool has (string key) const { return m_dict.find(key) != m_dict.end(); }

  string operator() (string key, string default_value) const
  {
    Auto i = m_dict.find(key);
    const string & value = (i == m_dict.end()) ? default_value : i->second;
    if (value != default_value) {
      LOG(" " << m_filename << ": " << key << " = " << value
          << " (default = " << default_value << ")");
    }
    return value;
  }

  int operator() (string key, int default_value) const
  {
    Auto i = m_dict.find(key);
    int value = (i == m_dict.end()) ? default_value : atoi(i->second.c_str());
    if (value != default_value) {
      LOG(" " << m_filename << ": " << key << " = " << value
          << " (default = " << default_value << ")");
    }
    return value;
  }

  double operator() (string key, double default_value) const
  {
    Auto i = m_dict.find(key);
    double value = (i == m_dict.end()) ? default_value
                                       : strtod(i->second.c_str(), NULL);
    if (value != default_value) {
      LOG(" " << m_filename << ": " << key << " = " << value
          << " (default = " << default_value << ")");
    }
    return value;
  }
};

#endif // VOWELPAD_CONFIG_H

