// SPDX-License-Identifier: LGPL-2.1-or-later
// SPDX-FileCopyrightText: 2001 David Megginson <david@megginson.com>

/**
 * @file
 * @brief Exception classes
 */

#pragma once

#include <exception>
#include <string>

/**
 * Information encapsulating a single location in an external resource
 *
 * For a report this is the report text and the index of the offending
 * group, for a command line the option text.
 */
class mg_location
{
public:
    mg_location();
    explicit mg_location(const std::string& path, int line = -1, int column = -1);

    const std::string& getPath() const { return _path; }
    int getLine() const { return _line; }
    int getColumn() const { return _column; }

    bool isValid() const;

    std::string asString() const;

private:
    std::string _path;
    int _line;
    int _column;
};


/**
 * Abstract base class for all throwables.
 */
class mg_throwable : public std::exception
{
public:
    mg_throwable();
    explicit mg_throwable(const std::string& message, const std::string& origin = {});
    virtual ~mg_throwable() noexcept = default;

    const std::string& getMessage() const { return _message; }
    const std::string& getOrigin() const { return _origin; }
    void setMessage(const std::string& message);
    void setOrigin(const std::string& origin);

    /**
     * message, plus any details a subclass wants the user to see
     */
    virtual std::string getFormattedMessage() const;

    const char* what() const noexcept override;

private:
    std::string _message;
    std::string _origin;
    mutable std::string _what;
};


/**
 * Base class for all MetGear exceptions.
 *
 * Exceptions represent conditions the caller is expected to handle,
 * such as input that cannot be decoded at all.
 */
class mg_exception : public mg_throwable
{
public:
    mg_exception() = default;
    explicit mg_exception(const std::string& message, const std::string& origin = {},
                          const mg_location& loc = {});

    const mg_location& getLocation() const { return _location; }

    std::string getFormattedMessage() const override;

private:
    mg_location _location;
};


/**
 * An I/O-related exception, e.g. a failing input stream.
 */
class mg_io_exception : public mg_exception
{
public:
    explicit mg_io_exception(const std::string& message,
                             const mg_location& location = {},
                             const std::string& origin = {});
};


/**
 * A bad format exception, carrying the text that could not be parsed.
 */
class mg_format_exception : public mg_exception
{
public:
    mg_format_exception(const std::string& message, const std::string& text,
                        const std::string& origin = {});

    const std::string& getText() const { return _text; }

    std::string getFormattedMessage() const override;

private:
    std::string _text;
};


/**
 * Raised when a report holds no data at all (empty or blank text).
 */
class mg_no_data_exception : public mg_exception
{
public:
    explicit mg_no_data_exception(const std::string& origin = {});
};
