#pragma once



#include <cstdint>
#include <filesystem>
#include <fstream>



namespace ccd2iso
{

std::fstream open_image(const std::filesystem::path &file_path);
uint64_t image_sectors_count(const std::filesystem::path &file_path);
std::filesystem::path default_iso_path(const std::filesystem::path &image_path);


// Output file written under a temporary name next to the target and renamed
// into place by Commit(), removed on destruction otherwise.
class TemporaryFile
{
public:
	explicit TemporaryFile(const std::filesystem::path &target_path);
	~TemporaryFile();

	std::fstream &Stream();
	const std::filesystem::path &Path() const;

	void Commit();

	TemporaryFile(TemporaryFile const &) = delete;
	void operator=(TemporaryFile const &) = delete;

private:
	std::filesystem::path _targetPath;
	std::filesystem::path _path;
	std::fstream _fs;
	bool _committed;
};

}
