#include <system_error>
#include "cd.hh"
#include "common.hh"
#include "logger.hh"
#include "file_io.hh"



namespace ccd2iso
{

std::fstream open_image(const std::filesystem::path &file_path)
{
	if(!std::filesystem::exists(file_path))
		throw_line("file doesn't exist ({})", file_path.string());

	if(!std::filesystem::is_regular_file(file_path))
		throw_line("not a regular file ({})", file_path.string());

	std::fstream fs(file_path, std::fstream::in | std::fstream::binary);
	if(!fs.is_open())
		throw_line("unable to open file ({})", file_path.string());

	return fs;
}


// incomplete trailing sector counts as a sector
uint64_t image_sectors_count(const std::filesystem::path &file_path)
{
	auto file_size = (uint64_t)std::filesystem::file_size(file_path);

	return scale_up(file_size, CD_DATA_SIZE);
}


std::filesystem::path default_iso_path(const std::filesystem::path &image_path)
{
	auto iso_path = image_path;
	iso_path.replace_extension(".iso");

	return iso_path;
}


TemporaryFile::TemporaryFile(const std::filesystem::path &target_path)
	: _targetPath(target_path)
	, _committed(false)
{
	auto directory = target_path.parent_path();
	for(uint32_t i = 0;; ++i)
	{
		_path = directory / fmt::format(".{}.{}.tmp", target_path.filename().string(), i);
		if(!std::filesystem::exists(_path))
			break;
	}

	_fs.open(_path, std::fstream::out | std::fstream::binary | std::fstream::trunc);
	if(!_fs.is_open())
		throw_line("unable to create file ({})", _path.string());
}


TemporaryFile::~TemporaryFile()
{
	if(_committed)
		return;

	if(_fs.is_open())
		_fs.close();

	std::error_code ec;
	std::filesystem::remove(_path, ec);
	if(ec)
		LOG("warning: unable to remove temporary file ({}, {})", _path.string(), ec.message());
}


std::fstream &TemporaryFile::Stream()
{
	return _fs;
}


const std::filesystem::path &TemporaryFile::Path() const
{
	return _path;
}


void TemporaryFile::Commit()
{
	_fs.close();
	if(_fs.fail())
		throw_line("write failed ({})", _path.string());

	std::error_code ec;
	std::filesystem::rename(_path, _targetPath, ec);
	if(ec)
		throw_line("unable to overwrite {}, the file might be mounted or marked read-only ({})", _targetPath.string(), ec.message());

	_committed = true;
}

}
