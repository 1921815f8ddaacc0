#ifndef STRINGIO_H
#define STRINGIO_H

#include <cstdio>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace stringio {

/** String formatting. */
template<typename ... Args>
std::string format(const std::string& format, Args ... args);
/** Splits a string by a delimiter into an existing vector */
std::vector<std::string> &split(const std::string&, char, std::vector<std::string>&);
/** Splits a string by a delimiter into a new vector */
std::vector<std::string> split(const std::string&, char);
/** Splits a string at runs of whitespace, dropping empty fields. */
std::vector<std::string> splitWhitespace(const std::string&);
/** Removes leading and trailing whitespace. */
std::string trim(const std::string&);
/** True if the string starts with the given prefix. */
bool startsWith(const std::string& s, const std::string& prefix);
/** Reads a line from a stream, dealing with different styles of line endings. */
std::istream& safeGetline(std::istream& is, std::string& t);

/* Templated function definitions. */

template<typename ... Args>
std::string format( const std::string& format, Args ... args )
{
  size_t size = std::snprintf( nullptr, 0, format.c_str(), args ... ) + 1; // Extra space for '\0'
  std::unique_ptr<char[]> buf( new char[ size ] );
  std::snprintf( buf.get(), size, format.c_str(), args ... );
  return std::string( buf.get(), buf.get() + size - 1 ); // We don't want the '\0' inside
}

} /* namespace stringio */

#endif /*STRINGIO_H */
