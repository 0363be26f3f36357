#include <array>
#include <fmt/format.h>
#include "convert.hh"



namespace ccd2iso
{

ConversionError::ConversionError(Type type, const std::string &message, uint64_t index)
	: std::runtime_error(message)
	, _type(type)
	, _index(index)
	, _bytesRead(0)
	, _expected(CD_DATA_SIZE)
	, _mode(0)
	, _addressValid(false)
	, _address{}
{
}


ConversionError ConversionError::IncompleteSector(uint64_t index, uint32_t bytes_read)
{
	ConversionError e(Type::INCOMPLETE_SECTOR, fmt::format("sector {} is incomplete, with only {} bytes instead of {}", index, bytes_read, CD_DATA_SIZE), index);
	e._bytesRead = bytes_read;

	return e;
}


ConversionError ConversionError::SessionMarker(uint64_t index, MSF address)
{
	ConversionError e(Type::SESSION_MARKER,
		fmt::format("found a session marker at sector {}, this image might contain multisession data", index), index);
	e._bytesRead = CD_DATA_SIZE;
	e._mode = SECTOR_MODE_SESSION_MARKER;
	e._addressValid = true;
	e._address = address;

	return e;
}


ConversionError ConversionError::UnrecognizedSectorMode(uint64_t index, MSF address, uint8_t mode)
{
	ConversionError e(Type::UNRECOGNIZED_SECTOR_MODE, fmt::format("unrecognized sector mode ({:02X}) at sector {}", mode, index), index);
	e._bytesRead = CD_DATA_SIZE;
	e._mode = mode;
	e._addressValid = true;
	e._address = address;

	return e;
}


ConversionError ConversionError::SourceReadFailed(uint64_t index)
{
	return ConversionError(Type::SOURCE_READ_FAILED, fmt::format("read failed at sector {}", index), index);
}


ConversionError ConversionError::DestinationWriteFailed(uint64_t index)
{
	ConversionError e(Type::DESTINATION_WRITE_FAILED, fmt::format("write failed at sector {}", index), index);
	e._bytesRead = CD_DATA_SIZE;

	return e;
}


ConversionError::Type ConversionError::GetType() const
{
	return _type;
}


uint64_t ConversionError::Index() const
{
	return _index;
}


uint32_t ConversionError::BytesRead() const
{
	return _bytesRead;
}


uint32_t ConversionError::Expected() const
{
	return _expected;
}


uint8_t ConversionError::Mode() const
{
	return _mode;
}


const MSF *ConversionError::Address() const
{
	return _addressValid ? &_address : nullptr;
}


ConversionResult convert(std::istream &source, std::ostream &destination, ProgressObserver *observer, const std::function<bool()> &interrupt)
{
	ConversionResult result = {};

	std::array<uint8_t, CD_DATA_SIZE> buffer;
	for(uint64_t index = 0;; ++index)
	{
		if(interrupt && interrupt())
		{
			result.interrupted = true;
			break;
		}

		source.read((char *)buffer.data(), buffer.size());
		auto bytes_read = (uint32_t)source.gcount();
		if(source.bad())
			throw ConversionError::SourceReadFailed(index);

		// clean end of image
		if(!bytes_read)
			break;

		if(bytes_read < CD_DATA_SIZE)
			throw ConversionError::IncompleteSector(index, bytes_read);

		auto sector = decode_sector(buffer);

		// mode order is relevant, session marker has to be reported as such
		std::span<const uint8_t> user_data;
		if(sector.mode == SECTOR_MODE1)
			user_data = std::get<Mode1Content>(sector.content).user_data;
		else if(sector.mode == SECTOR_MODE2)
			user_data = std::get<Mode2Content>(sector.content).user_data;
		else if(sector.mode == SECTOR_MODE_SESSION_MARKER)
			throw ConversionError::SessionMarker(index, sector.address);
		else
			throw ConversionError::UnrecognizedSectorMode(index, sector.address, sector.mode);

		destination.write((const char *)user_data.data(), user_data.size());
		if(destination.fail())
			throw ConversionError::DestinationWriteFailed(index);

		if(sector.mode == SECTOR_MODE1)
			++result.mode1_sectors;
		else
			++result.mode2_sectors;
		result.sectors = index + 1;

		if(observer != nullptr)
			observer->SectorWritten(result.sectors);
	}

	return result;
}

}
