/*!
 * \file util.cpp
 * \brief file util.cpp
 *
 * Adapted from: WRATHUtil.cpp of WRATH:
 *
 * Copyright 2013 by Nomovok Ltd.
 * Contact: info@nomovok.com
 * This Source Code Form is subject to the
 * terms of the Mozilla Public License, v. 2.0.
 * If a copy of the MPL was not distributed with
 * this file, You can obtain one at
 * http://mozilla.org/MPL/2.0/.
 *
 * \author Kevin Rogovin <kevin.rogovin@nomovok.com>
 * \author Kevin Rogovin <kevin.rogovin@gmail.com>
 *
 */

#include <string>
#include <iostream>
#include <algorithm>
#include <cstring>
#include <cstdlib>
#ifdef __linux__
#include <execinfo.h>
#include <cxxabi.h>
#endif

#include <blendpaint/util/util.hpp>

#ifdef __linux__
namespace
{
  std::string
  demangled_function_name(const char *backtrace_string)
  {
    if (!backtrace_string)
      {
        return "";
      }

    /* backtrace gives the symbol as follows:
     *  library_name(mangled_function_name+offset) [return_address]
     */
    const char *open_paren, *plus, *end;

    end = backtrace_string + std::strlen(backtrace_string);
    open_paren = std::find(backtrace_string, end, '(');
    if (open_paren == end)
      {
        return "";
      }
    ++open_paren;
    plus = std::find(open_paren, end, '+');
    if (plus == end)
      {
        return "";
      }

    char *demangle_c_string;
    int status;
    std::string tmp(open_paren, plus);

    demangle_c_string = abi::__cxa_demangle(tmp.c_str(), nullptr, nullptr, &status);
    if (demangle_c_string == nullptr)
      {
        return tmp;
      }

    std::string return_value(demangle_c_string);
    std::free(demangle_c_string);
    return return_value;
  }

  void
  print_backtrace(std::ostream &ostr)
  {
    const int max_frames = 64;
    void *frames[max_frames];
    char **symbols;
    int num_frames;

    num_frames = backtrace(frames, max_frames);
    symbols = backtrace_symbols(frames, num_frames);
    if (!symbols)
      {
        return;
      }

    /* skip this function and assert_fail */
    for (int i = 2; i < num_frames; ++i)
      {
        std::string nm(demangled_function_name(symbols[i]));
        ostr << "\t" << (nm.empty() ? symbols[i] : nm.c_str()) << "\n";
      }
    std::free(symbols);
  }
}
#endif

void
blendpaint::
assert_fail(c_string str, c_string file, int line)
{
  std::cerr << "[" << file << "," << line << "]: " << str << "\n";

  #ifdef __linux__
    {
      print_backtrace(std::cerr);
    }
  #endif

  #ifdef BLENDPAINT_DEBUG
    {
      std::abort();
    }
  #endif
}
