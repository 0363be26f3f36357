#include <filesystem>
#include <fmt/format.h>
#include "common.hh"
#include "convert.hh"
#include "file_io.hh"
#include "logger.hh"
#include "signal.hh"
#include "ccd2iso.hh"



namespace ccd2iso
{

namespace
{

class ConsoleProgress : public ProgressObserver
{
public:
	explicit ConsoleProgress(uint64_t sectors_total)
		: _sectorsTotal(sectors_total)
		, _percentage(0)
		, _displayed(false)
	{
	}


	void SectorWritten(uint64_t sectors_count) override
	{
		// redraw only when something visible changes
		auto p = percentage(sectors_count, _sectorsTotal);
		if(_displayed && p == _percentage && sectors_count % SECTORS_PER_REDRAW && sectors_count != _sectorsTotal)
			return;

		_percentage = p;
		_displayed = true;

		LOG_R();
		LOGC_F("[{:3}%] sector: {}/{}", p, sectors_count, _sectorsTotal);
	}


	// terminate progress line
	void Finish()
	{
		if(_displayed)
			LOGC("");
		_displayed = false;
	}

private:
	static constexpr uint64_t SECTORS_PER_REDRAW = 1000;

	uint64_t _sectorsTotal;
	uint32_t _percentage;
	bool _displayed;
};


void log_conversion_error(const ConversionError &e)
{
	LOG("error: {}", e.what());

	switch(e.GetType())
	{
	case ConversionError::Type::INCOMPLETE_SECTOR:
		LOG("the image is truncated or is not a CloneCD image");
		break;

	case ConversionError::Type::SESSION_MARKER:
		LOG("the iso was not written, multisession images are not supported");
		[[fallthrough]];
	case ConversionError::Type::UNRECOGNIZED_SECTOR_MODE:
		if(auto address = e.Address(); address != nullptr)
		{
			if(BCDMSF_valid(*address))
				LOGV("sector address: {:02X}:{:02X}:{:02X} (LBA: {})", address->m, address->s, address->f, BCDMSF_to_LBA(*address));
			else
				LOGV("sector address: {:02X}:{:02X}:{:02X} (invalid)", address->m, address->s, address->f);
		}
		break;

	case ConversionError::Type::SOURCE_READ_FAILED:
	case ConversionError::Type::DESTINATION_WRITE_FAILED:
		break;
	}
}

}


std::string ccd2iso_version()
{
	return fmt::format("ccd2iso v{}.{}.{}", XSTRINGIFY(CCD2ISO_VERSION_MAJOR), XSTRINGIFY(CCD2ISO_VERSION_MINOR), XSTRINGIFY(CCD2ISO_VERSION_PATCH));
}


int convert_image(const Options &options)
{
	if(!options.log_file.empty())
		Logger::Get().Reset(options.log_file);
	Logger::Get().SetVerbose(options.verbose);

	if(options.positional.empty())
		throw_line("image file is not provided");
	if(options.positional.size() > 2)
		throw_line("too many arguments ({})", options.positional.size());

	std::filesystem::path image_path(options.positional.front());
	std::filesystem::path iso_path = options.positional.size() == 2 ? std::filesystem::path(options.positional.back()) : default_iso_path(image_path);

	LOGV("{}", ccd2iso_version());
	LOGV("command line: {}", options.command_line);
	LOGV("image: {}", image_path.string());
	LOGV("iso: {}", iso_path.string());

	auto fs_img = open_image(image_path);

	if(std::filesystem::exists(iso_path) && !options.force)
		throw_line("{} already exists, pass --force if you want to overwrite it", iso_path.string());

	auto sectors_total = image_sectors_count(image_path);
	LOGV("sectors: {}", sectors_total);

	TemporaryFile iso_file(iso_path);
	LOGV("temporary file: {}", iso_file.Path().string());

	ConsoleProgress progress(sectors_total);
	ConversionResult result = {};
	try
	{
		InterruptGuard interrupt_guard;
		result = convert(fs_img, iso_file.Stream(), options.quiet ? nullptr : &progress, [&interrupt_guard]() { return interrupt_guard.Interrupted(); });
		progress.Finish();
	}
	catch(const ConversionError &e)
	{
		progress.Finish();
		log_conversion_error(e);
		return 1;
	}

	if(result.interrupted)
	{
		LOG("cancelled");
		return 1;
	}

	iso_file.Commit();

	LOGV("mode 1 sectors: {}, mode 2 sectors: {}", result.mode1_sectors, result.mode2_sectors);
	LOG("done ({} sectors, {} bytes)", result.sectors, result.sectors * FORM1_DATA_SIZE);

	return 0;
}

}
