#pragma once

// Contains typedefs for the entire project

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

//[ Int types ]//
using ui8 = std::uint8_t;

//[ NETWORKING DEFS ]//
using Url         = std::string;       // Absolute URL (scheme://host[:port]/target)
using Host        = std::string;       // Host part of a URL
using PortNo      = std::string;       // Port (kept as string, this is what the resolver wants)
using NetTarget   = std::string;       // Path + query sent in the request line
using NetResponse = std::string;       // Raw response body
using HeaderField = std::pair<std::string, std::string>;
using HeaderList  = std::vector<HeaderField>;
using HttpStatus  = int;

//[ MANIFEST CONTENT ]//
using ManifestData = std::string; // The manifest text as fetched
using ContentID    = std::string; // Identifier of a video inside the vendor API
using Bitrate      = long;        // Quality level, in bits per second
using Bitrates     = std::vector<Bitrate>;

//[ TIMELINE ]//
using Seconds       = double; // Timeline positions and durations
using FragmentIndex = std::size_t;

//[ MEDIA DATA ]//
using MediaByte   = ui8;
using MediaBuffer = std::vector<MediaByte>; // Raw bytes (RGB24 pixels, PCM samples)
using ByteCount   = std::size_t;
using StreamIdx   = int;
