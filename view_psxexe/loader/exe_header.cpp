/*
 * PS-X EXE Header
 */

#include "exe_header.h"
#include "common/psxexe_utils.h"

#include <cstring>

namespace psxexe {

bool HasExeMagic(const uint8_t* data, size_t length)
{
	if (!data || length < HeaderOffsets::kMagic + kExeMagicLength)
		return false;
	return memcmp(data + HeaderOffsets::kMagic, kExeMagic, kExeMagicLength) == 0;
}

/*
 * The marker is plain ASCII terminated by NUL (or by the end of the header).
 * Non-printable bytes end the marker as well so garbage padding does not leak
 * into logs and metadata.
 */
static std::string ReadMarker(const uint8_t* data, size_t length)
{
	std::string marker;
	size_t end = (length < kHeaderSize) ? length : kHeaderSize;
	for (size_t i = HeaderOffsets::kMarker; i < end; i++)
	{
		char c = static_cast<char>(data[i]);
		if (c < 0x20 || c > 0x7E)
			break;
		marker.push_back(c);
	}
	while (!marker.empty() && marker.back() == ' ')
		marker.pop_back();
	return marker;
}

bool IsExeCandidate(const uint8_t* data, size_t length)
{
	return length >= HeaderOffsets::kFieldsEnd && HasExeMagic(data, length);
}

std::optional<ExeHeader> ParseExeHeader(const uint8_t* data, size_t length)
{
	if (!IsExeCandidate(data, length))
		return std::nullopt;

	ExeHeader header;
	header.initialPc = ReadLE32(data + HeaderOffsets::kInitialPc);
	header.initialGp = ReadLE32(data + HeaderOffsets::kInitialGp);
	header.loadAddress = ReadLE32(data + HeaderOffsets::kLoadAddress);
	header.codeSize = ReadLE32(data + HeaderOffsets::kCodeSize);
	header.dataAddress = ReadLE32(data + HeaderOffsets::kDataAddress);
	header.dataSize = ReadLE32(data + HeaderOffsets::kDataSize);
	header.bssAddress = ReadLE32(data + HeaderOffsets::kBssAddress);
	header.bssSize = ReadLE32(data + HeaderOffsets::kBssSize);
	header.stackBase = ReadLE32(data + HeaderOffsets::kStackBase);
	header.stackOffset = ReadLE32(data + HeaderOffsets::kStackOffset);
	header.marker = ReadMarker(data, length);
	return header;
}

MarkerRegion GetMarkerRegion(const std::string& marker)
{
	if (marker.find("North America") != std::string::npos)
		return MarkerRegion::NorthAmerica;
	if (marker.find("Japan") != std::string::npos)
		return MarkerRegion::Japan;
	if (marker.find("Europe") != std::string::npos)
		return MarkerRegion::Europe;
	return MarkerRegion::Unknown;
}

const char* GetMarkerRegionName(MarkerRegion region)
{
	switch (region)
	{
	case MarkerRegion::NorthAmerica:
		return "NA";
	case MarkerRegion::Japan:
		return "JP";
	case MarkerRegion::Europe:
		return "EU";
	default:
		return "";
	}
}

} /* namespace psxexe */
