#pragma once



#include <cstdint>
#include <functional>
#include <istream>
#include <ostream>
#include <stdexcept>
#include <string>
#include "cd.hh"



namespace ccd2iso
{

// terminal conversion failure, the type and the fields describe what happened
// and what() carries a ready to print message
class ConversionError : public std::runtime_error
{
public:
	enum class Type
	{
		INCOMPLETE_SECTOR,
		SESSION_MARKER,
		UNRECOGNIZED_SECTOR_MODE,
		SOURCE_READ_FAILED,
		DESTINATION_WRITE_FAILED
	};

	static ConversionError IncompleteSector(uint64_t index, uint32_t bytes_read);
	static ConversionError SessionMarker(uint64_t index, MSF address);
	static ConversionError UnrecognizedSectorMode(uint64_t index, MSF address, uint8_t mode);
	static ConversionError SourceReadFailed(uint64_t index);
	static ConversionError DestinationWriteFailed(uint64_t index);

	Type GetType() const;
	uint64_t Index() const;
	uint32_t BytesRead() const;
	uint32_t Expected() const;
	uint8_t Mode() const;

	// BCD address from the sector header, only for SESSION_MARKER and UNRECOGNIZED_SECTOR_MODE
	const MSF *Address() const;

private:
	Type _type;
	uint64_t _index;
	uint32_t _bytesRead;
	uint32_t _expected;
	uint8_t _mode;
	bool _addressValid;
	MSF _address;

	ConversionError(Type type, const std::string &message, uint64_t index);
};


class ProgressObserver
{
public:
	virtual ~ProgressObserver() = default;

	// called after every sector written with the running count of written sectors
	virtual void SectorWritten(uint64_t sectors_count) = 0;
};


struct ConversionResult
{
	uint64_t sectors;
	uint64_t mode1_sectors;
	uint64_t mode2_sectors;

	// stopped by the interrupt predicate, the output is incomplete
	bool interrupted;
};


// Streams CloneCD raw sectors from source to destination, keeping only the
// 2048 byte user data of each sector. The interrupt predicate, if provided,
// is queried before every sector read. Throws ConversionError, destination
// keeps everything written before the failure.
ConversionResult convert(std::istream &source, std::ostream &destination, ProgressObserver *observer = nullptr, const std::function<bool()> &interrupt = nullptr);

}
