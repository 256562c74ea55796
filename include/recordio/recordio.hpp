#pragma once

/** \file recordio.hpp
 *  \brief Umbrella header for the record log APIs.
 *
 *  - Framing constants and header codec (log/format.hpp)
 *  - CRC32C (log/crc32c.hpp)
 *  - Stream interfaces and memory/file implementations (log/stream.hpp, log/memory_stream.hpp, log/file_stream.hpp)
 *  - Writer (log/writer.hpp) and reader with corruption recovery (log/reader.hpp)
 */

#include "recordio/error.hpp"
#include "recordio/log/format.hpp"
#include "recordio/log/crc32c.hpp"
#include "recordio/log/stream.hpp"
#include "recordio/log/memory_stream.hpp"
#include "recordio/log/file_stream.hpp"
#include "recordio/log/diagnostics.hpp"
#include "recordio/log/writer.hpp"
#include "recordio/log/reader.hpp"
