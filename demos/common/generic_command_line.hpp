/*
  Copyright (c) 2009, Kevin Rogovin All rights reserved.

Redistribution and use in source and binary forms, with or without
modification, are permitted provided that the following conditions are
met:

    * Redistributions of source code must retain the above copyright
    * notice, this list of conditions and the following disclaimer.
    * Redistributions in binary form must reproduce the above
    * copyright notice, this list of conditions and the following
    * disclaimer in the documentation and/or other materials provided
    * with the distribution.  Neither the name of the Kevin Rogovin or
    * kRogue Technologies  nor the names of its contributors may
    * be used to endorse or promote products derived from this
    * software without specific prior written permission.

THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS
"AS IS" AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT
LIMITED TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR
A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT
OWNER OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL,
SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT
LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE,
DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY
THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT
(INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
*/


/** \file generic_command_line.hpp */
#pragma once

#include <iostream>
#include <vector>
#include <algorithm>
#include <map>
#include <string>
#include <sstream>
#include <ciso646>
#include <blendpaint/util/util.hpp>

class command_line_register;
class command_line_argument;


//!\class command_line_register
/*!
  A command_line_register walks the a command
  line argument list, calling its command_line_argument
  children's check_arg() method to get the values
  from a command line argument list.
 */
class command_line_register:blendpaint::noncopyable
{
private:
  friend class command_line_argument;

  std::vector<command_line_argument*> m_children;

public:

  command_line_register(void)
  {}

  ~command_line_register();

  void
  parse_command_line(int argc, char **argv);

  void
  parse_command_line(const std::vector<std::string> &strings);

  void
  print_help(std::ostream&) const;

  void
  print_detailed_help(std::ostream&) const;
};

//!\class command_line_argument
/*!
  A command_line_argument reads from an argument
  list to set a value.
 */
class command_line_argument:blendpaint::noncopyable
{
private:

  friend class command_line_register;

  int m_location;
  command_line_register *m_parent;

public:

  explicit
  command_line_argument(command_line_register &parent):
    m_parent(&parent)
  {
    m_location = parent.m_children.size();
    parent.m_children.push_back(this);
  }

  virtual
  ~command_line_argument();

  //!\fn check_arg
  /*!
    To be implemented by a dervied class.

    \param args the argv argument of main(int argc, char **argv)
                as an array of std::string, note that
                args.size() equals argc
    \param location current index into args[] being examined

    returns the number of arguments consumed, 0 is allowed.
   */
  virtual
  int
  check_arg(const std::vector<std::string> &args,
            int location) = 0;

  virtual
  void
  print_command_line_description(std::ostream&) const = 0;

  virtual
  void
  print_detailed_description(std::ostream&) const = 0;

  static
  std::string
  format_description_string(const std::string &name, const std::string &desc);

  static
  std::string
  tabs_to_spaces(const std::string &pin);

protected:
  /*!
    Checks if args[location] is of the form name=value,
    name:value or if args[location] is name followed by
    a value in args[location + 1]. Returns the number of
    arguments consumed, 0 if the argument does not match,
    and on a match writes the value string to out_value.
   */
  static
  int
  match_named_value(const std::string &name,
                    const std::vector<std::string> &args,
                    int location, std::string &out_value);
};

/*
  not a command line option, but prints a separator for detailed help
 */
class command_separator:public command_line_argument
{
public:
  command_separator(const std::string &label,
                    command_line_register &parent):
    command_line_argument(parent),
    m_label(label)
  {}

  virtual
  int
  check_arg(const std::vector<std::string> &, int)
  {
    return 0;
  }

  virtual
  void
  print_command_line_description(std::ostream&) const
  {}

  virtual
  void
  print_detailed_description(std::ostream &ostr) const
  {
    ostr << "\n\n---------- " << m_label << " ------------------\n";
  }

private:
  std::string m_label;
};

template<typename T>
void
readvalue_from_string(T &value,
                      const std::string &value_string)
{
  std::istringstream istr(value_string);
  istr >> value;
}

template<>
inline
void
readvalue_from_string(std::string &value,
                      const std::string &value_string)
{
  value = value_string;
}

template<>
inline
void
readvalue_from_string(bool &value, const std::string &value_string)
{
  if (value_string == std::string("on")
     or value_string == std::string("true"))
    {
      value = true;
    }
  else if (value_string == std::string("off")
     or value_string == std::string("false"))
    {
      value = false;
    }
}

template<typename T>
void
writevalue_to_stream(const T &value, std::ostream &ostr)
{
  ostr << value;
}

template<>
inline
void
writevalue_to_stream(const bool &value, std::ostream &ostr)
{
  if (value)
    {
      ostr << "on/true";
    }
  else
    {
      ostr << "off/false";
    }
}

/*
  Set of labels for the values of an enumeration; the
  labels are what is read from the command line.
 */
template<typename T>
class enumerated_string_type
{
public:
  typedef std::pair<std::string, std::string> label_desc;

  std::map<std::string, T> m_value_strings;
  std::map<T, label_desc> m_value_Ts;

  enumerated_string_type&
  add_entry(const std::string &label, T v, const std::string &description)
  {
    m_value_strings[label] = v;
    m_value_Ts[v] = label_desc(label, description);
    return *this;
  }

  /*
    Provided as a conveniance, adds an entry for each
    value in [0, count) using a label function of the
    enumeration; the description is the label.
   */
  template<typename F>
  enumerated_string_type&
  add_entries(int count, F label_function)
  {
    for (int i = 0; i < count; ++i)
      {
        T v(static_cast<T>(i));
        std::string label(label_function(v));
        add_entry(label, v, label);
      }
    return *this;
  }
};

template<typename T>
class command_line_argument_value:public command_line_argument
{
private:
  std::string m_name;
  std::string m_description;
  bool m_set_by_command_line;

public:
  T m_value;

  command_line_argument_value(T v, const std::string &nm,
                              const std::string &desc,
                              command_line_register &p):
    command_line_argument(p),
    m_name(nm),
    m_set_by_command_line(false),
    m_value(v)
  {
    std::ostringstream ostr;
    ostr << "\n\t"
         << m_name << " (default value=";

    writevalue_to_stream(m_value, ostr);
    ostr << ") " << format_description_string(m_name, desc);
    m_description = tabs_to_spaces(ostr.str());
  }

  bool
  set_by_command_line(void) const
  {
    return m_set_by_command_line;
  }

  virtual
  int
  check_arg(const std::vector<std::string> &argv, int location)
  {
    std::string val;
    int return_value;

    return_value = match_named_value(m_name, argv, location, val);
    if (return_value > 0)
      {
        readvalue_from_string(m_value, val);
        std::cout << "\n\t" << m_name << " set to ";
        writevalue_to_stream(m_value, std::cout);
        m_set_by_command_line = true;
      }
    return return_value;
  }

  virtual
  void
  print_command_line_description(std::ostream &ostr) const
  {
    ostr << "[" << m_name << "=value] "
         << "[" << m_name << ":value] "
         << "[" << m_name << " value]";
  }

  virtual
  void
  print_detailed_description(std::ostream &ostr) const
  {
    ostr << m_description;
  }
};

template<typename T>
class enumerated_command_line_argument_value:public command_line_argument
{
private:
  std::string m_name;
  std::string m_description;
  enumerated_string_type<T> m_label_set;
  bool m_set_by_command_line;

public:
  T m_value;

  enumerated_command_line_argument_value(T v, const enumerated_string_type<T> &L,
                                         const std::string &nm, const std::string &desc,
                                         command_line_register &p):
    command_line_argument(p),
    m_name(nm),
    m_label_set(L),
    m_set_by_command_line(false),
    m_value(v)
  {
    std::ostringstream ostr, ostr_desc;
    typename std::map<T, typename enumerated_string_type<T>::label_desc>::const_iterator iter, end;

    ostr << "\n\t"
         << m_name << " (default value=";

    iter = m_label_set.m_value_Ts.find(v);
    if (iter != m_label_set.m_value_Ts.end())
      {
        ostr << iter->second.first;
      }
    else
      {
        ostr << v;
      }
    ostr << ")";

    ostr_desc << desc << " Possible values:\n\n";
    for(iter = m_label_set.m_value_Ts.begin(), end = m_label_set.m_value_Ts.end();
        iter != end; ++iter)
      {
        ostr_desc << iter->second.first << ":" << iter->second.second << "\n\n";
      }
    ostr << format_description_string(m_name, ostr_desc.str());
    m_description = tabs_to_spaces(ostr.str());
  }

  bool
  set_by_command_line(void) const
  {
    return m_set_by_command_line;
  }

  virtual
  int
  check_arg(const std::vector<std::string> &argv, int location)
  {
    std::string val;
    int return_value;

    return_value = match_named_value(m_name, argv, location, val);
    if (return_value > 0)
      {
        typename std::map<std::string, T>::const_iterator iter;

        iter = m_label_set.m_value_strings.find(val);
        if (iter != m_label_set.m_value_strings.end())
          {
            m_value = iter->second;
            std::cout << "\n\t" << m_name << " set to " << val;
            m_set_by_command_line = true;
          }
        else
          {
            std::cout << "\n\tUnknown value \"" << val << "\" for "
                      << m_name << ", ignored";
          }
      }
    return return_value;
  }

  virtual
  void
  print_command_line_description(std::ostream &ostr) const
  {
    ostr << "[" << m_name << "=value] "
         << "[" << m_name << ":value] "
         << "[" << m_name << " value]";
  }

  virtual
  void
  print_detailed_description(std::ostream &ostr) const
  {
    ostr << m_description;
  }
};
