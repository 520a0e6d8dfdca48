//
//  Copyright (c) 2013-2015 plan44.ch / Lukas Zeller, Zurich, Switzerland
//
//  Author: Lukas Zeller <luz@plan44.ch>
//
//  This file is part of dlnacast.
//
//  dlnacast is free software: you can redistribute it and/or modify
//  it under the terms of the GNU General Public License as published by
//  the Free Software Foundation, either version 3 of the License, or
//  (at your option) any later version.
//
//  dlnacast is distributed in the hope that it will be useful,
//  but WITHOUT ANY WARRANTY; without even the implied warranty of
//  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
//  GNU General Public License for more details.
//
//  You should have received a copy of the GNU General Public License
//  along with dlnacast. If not, see <http://www.gnu.org/licenses/>.
//

#ifndef __dlnacast__utils__
#define __dlnacast__utils__

#include <string>
#include <stdarg.h>
#include <stdint.h>

using namespace std;

namespace dlnacast {

  /// printf-style format into std::string
  /// @param aFormat printf-style format string
  /// @return formatted string
  std::string string_format(const char *aFormat, ...);

  /// printf-style format appending to std::string
  /// @param aStringToAppendTo std::string to append format to
  /// @param aFormat printf-style format string
  void string_format_append(std::string &aStringToAppendTo, const char *aFormat, ...);

  /// printf-style format into std::string
  /// @param aStringObj string to format into
  /// @param aAppend if true, formatted output is appended to aStringObj, otherwise aStringObj is replaced
  /// @param aFormat printf-style format string
  /// @param aArgs argument list
  void string_format_v(std::string &aStringObj, bool aAppend, const char *aFormat, va_list aArgs);

  /// always return a valid C String, if NULL is passed, an empty string is returned
  /// @param aNULLOrCStr NULL or C-String
  /// @return the input string if it is non-NULL, or an empty string
  const char *nonNullCStr(const char *aNULLOrCStr);

  /// return simple (non locale aware) ASCII lowercase version of string
  /// @param aString a string
  /// @return lowercase (char by char tolower())
  string lowerCase(const char *aString);
  string lowerCase(const string &aString);

  /// return simple (non locale aware) ASCII uppercase version of string
  string upperCase(const string &aString);

  /// return string with whitespace removed
  /// @param aString a string
  /// @param aLeading remove leading whitespace
  /// @param aTrailing remove trailing whitespace
  /// @return trimmed string
  string trimWhiteSpace(const string &aString, bool aLeading = true, bool aTrailing = true);

  /// get next line from a text
  /// @param aCursor at entry: points to beginning of line. On return: points to beginning of next line
  /// @param aLine will receive the line, without line end characters (LF, CR or CRLF)
  /// @return false if there is no line (aCursor at end of text)
  bool nextLine(const char * &aCursor, string &aLine);

  /// split a "key: value" line
  /// @param aInput the line
  /// @param aKey receives the key, trimmed
  /// @param aValue receives the value, leading whitespace removed
  /// @return true if aInput is a key/value line with a non-empty key
  bool keyAndValue(const string &aInput, string &aKey, string &aValue);

  /// split URL into its parts
  /// @param aURI the URL to split
  /// @param aProtocol if not NULL, receives the protocol ("http")
  /// @param aHost if not NULL, receives the host specification, including port if any
  /// @param aDoc if not NULL, receives the document path, without leading slash
  /// @param aUser if not NULL, receives the user name
  /// @param aPasswd if not NULL, receives the password
  void splitURL(const char *aURI, string *aProtocol, string *aHost, string *aDoc, string *aUser = NULL, string *aPasswd = NULL);

  /// split host specification into host name and port
  /// @param aHostSpec host specification like "example.com:80" or "[fe80::1]:80"
  /// @param aHostName if not NULL, receives the host name (IPv6 literals without brackets)
  /// @param aPortNumber if not NULL, receives the port number if one is specified, otherwise it is left untouched
  void splitHost(const char *aHostSpec, string *aHostName, uint16_t *aPortNumber);

  /// escape text for use as XML character data or attribute value
  /// @param aText text to escape
  /// @return text with &, <, >, " and ' replaced by entity references
  string xmlEscape(const string &aText);

  /// check if a string contains another one
  /// @param aString the string to search in
  /// @param aSubString the string to look for
  /// @return true if aSubString occurs in aString (an empty aSubString never matches)
  bool containsString(const string &aString, const string &aSubString);

} // namespace dlnacast

#endif /* defined(__dlnacast__utils__) */
