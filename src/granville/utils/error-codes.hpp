
#pragma once

#include <system_error>

/**
 * @defgroup error-codes Error Codes
 * @ingroup granville-utils
 *
 * ~~~~~~~~~~~~~~~~~~~~~~{.cpp}
 * // The connection was disposed before the send went out
 * completion(make_error_code(ecode::connection_disposed));
 * ~~~~~~~~~~~~~~~~~~~~~~
 */

namespace granville
{
using std::error_code;

/**
 * @ingroup error-codes
 * @brief Complete set of granville error codes.
 */
enum class ecode : int {
   okay = 0,           //!< i.e., everything's okay.
   logic_error,        //!< Faulty logic in the program.
   operation_failed,   //!< Like a system error, but within the program.
   exception_occurred, //!< Exception caught and forwarded as an error_code.
   argument_error,     //!< An invalid argument was supplied.
   type_error,         //!< Decoded value has the wrong wire type.

   premature_eof,    //!< Input ended before the value was complete.
   object_too_large, //!< Attempt to read/write an object that is too large.
   invalid_data,     //!< Input data (file/network/etc.) was invalid.
   value_out_of_range, //!< A decoded integer does not fit the target type.

   not_connected,       //!< The transport has no live connection.
   already_connected,   //!< Connect was called on a connected transport.
   connection_refused,  //!< The remote end refused the connection.
   connection_closed,   //!< The connection closed while the operation was pending.
   connection_disposed, //!< The connection wrapper was disposed.
   connect_timeout,     //!< The connect did not finish in time.
   message_too_large    //!< The message exceeds the maximum message size.
};
} // namespace granville

namespace std
{
template<> struct is_error_code_enum<granville::ecode> : true_type
{};
} // namespace std

namespace granville
{
error_code make_error_code(ecode);
} // namespace granville
