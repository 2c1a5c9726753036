/*
 * Copyright (C) 2024-2026 Niklas Klügel <lodsb@lodsb.org>
 *
 * This program is free software; you can redistribute it and/or
 * modify it under the terms of the GNU General Public License
 * version 2, as published by the Free Software Foundation.
 *
 * This program is distributed in the hope that it will be useful, but
 * WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU
 * General Public License version 2 for more details.
 *
 * You should have received a copy of the GNU General Public License
 * version 2 along with this program; if not, write to the Free
 * Software Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston,
 * MA 02110-1301, USA.
 *
 */

#include "error.h"

namespace icmd {
namespace protocol {

const char* error_kind_name(ErrorKind kind)
{
    switch (kind) {
        case ErrorKind::TRANSPORT_FAULT:      return "transport fault";
        case ErrorKind::PROTOCOL_VIOLATION:   return "protocol violation";
        case ErrorKind::DECODE_INCONSISTENCY: return "decode inconsistency";
    }
    return "unknown";
}

std::string Error::to_string() const
{
    std::string s = error_kind_name(kind);
    if (!detail.empty()) {
        s += ": ";
        s += detail;
    }
    return s;
}

} // namespace protocol
} // namespace icmd
