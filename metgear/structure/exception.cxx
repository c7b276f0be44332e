// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: 2001 David Megginson <david@megginson.com>

/**
 * @file
 * @brief Exception classes
 */

#include <metgear_config.h>

#include "exception.hxx"

#include <new>
#include <sstream>

////////////////////////////////////////////////////////////////////////
// Implementation of mg_location class.
////////////////////////////////////////////////////////////////////////

mg_location::mg_location() :
    _line(-1),
    _column(-1)
{
}

mg_location::mg_location(const std::string& path, int line, int column) :
    _path(path),
    _line(line),
    _column(column)
{
}

bool mg_location::isValid() const
{
    return !_path.empty() || _line >= 0 || _column >= 0;
}

std::string mg_location::asString() const
{
    std::ostringstream out;
    out << _path;
    if (_line >= 0)
        out << ", line " << _line;
    if (_column >= 0)
        out << ", column " << _column;
    return out.str();
}


////////////////////////////////////////////////////////////////////////
// Implementation of mg_throwable class.
////////////////////////////////////////////////////////////////////////

mg_throwable::mg_throwable() = default;

mg_throwable::mg_throwable(const std::string& message, const std::string& origin) :
    _message(message),
    _origin(origin)
{
}

void mg_throwable::setMessage(const std::string& message)
{
    _message = message;
}

void mg_throwable::setOrigin(const std::string& origin)
{
    _origin = origin;
}

std::string mg_throwable::getFormattedMessage() const
{
    return _message;
}

const char* mg_throwable::what() const noexcept
{
    try {
        _what = getFormattedMessage();
        return _what.c_str();
    } catch (std::bad_alloc&) {
        return "mg_throwable: out of memory formatting message";
    }
}


////////////////////////////////////////////////////////////////////////
// Implementation of mg_exception class.
////////////////////////////////////////////////////////////////////////

mg_exception::mg_exception(const std::string& message, const std::string& origin,
                           const mg_location& loc) :
    mg_throwable(message, origin),
    _location(loc)
{
}

std::string mg_exception::getFormattedMessage() const
{
    std::string ret = getMessage();
    if (_location.isValid()) {
        ret += "\n at ";
        ret += _location.asString();
    }
    return ret;
}


////////////////////////////////////////////////////////////////////////
// Implementation of mg_io_exception.
////////////////////////////////////////////////////////////////////////

mg_io_exception::mg_io_exception(const std::string& message,
                                 const mg_location& location,
                                 const std::string& origin) :
    mg_exception(message, origin, location)
{
}


////////////////////////////////////////////////////////////////////////
// Implementation of mg_format_exception.
////////////////////////////////////////////////////////////////////////

mg_format_exception::mg_format_exception(const std::string& message,
                                         const std::string& text,
                                         const std::string& origin) :
    mg_exception(message, origin),
    _text(text)
{
}

std::string mg_format_exception::getFormattedMessage() const
{
    return getMessage() + ": '" + _text + "'";
}


////////////////////////////////////////////////////////////////////////
// Implementation of mg_no_data_exception.
////////////////////////////////////////////////////////////////////////

mg_no_data_exception::mg_no_data_exception(const std::string& origin) :
    mg_exception("Data not available", origin)
{
}
