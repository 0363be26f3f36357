#pragma once



#include <filesystem>
#include <fmt/format.h>
#include <fstream>
#include <iostream>
#include <string>



namespace ccd2iso
{

class Logger
{
public:
	static Logger &Get();

	template<typename... Args>
	void Log(bool file, std::string format, const Args &... args)
	{
		auto message = fmt::vformat(format, fmt::make_format_args(args...));

		std::cout << message;

		if(file && _fs.is_open())
			_fs << message;
	}

	bool Reset(std::filesystem::path log_path);

	void NL(bool file = true);
	void Flush(bool file);
	void ReturnLine();

	void SetVerbose(bool verbose);
	bool Verbose() const;

private:
	static Logger _logger;

	std::filesystem::path _log_path;
	std::fstream _fs;
	bool _verbose = false;
};


// log message followed by a new line (console & file)
template<typename... Args>
void LOG(std::string format, const Args &... args)
{
	auto &logger = Logger::Get();
	logger.Log(true, format, args...);
	logger.NL(true);
}


// log message followed by a new line if verbose output is enabled (console & file)
template<typename... Args>
void LOGV(std::string format, const Args &... args)
{
	auto &logger = Logger::Get();
	if(!logger.Verbose())
		return;

	logger.Log(true, format, args...);
	logger.NL(true);
}


// log message followed by a new line (console only)
template<typename... Args>
void LOGC(std::string format, const Args &... args)
{
	auto &logger = Logger::Get();
	logger.Log(false, format, args...);
	logger.NL(false);
}


// log message and flush, no new line (console only)
template<typename... Args>
void LOGC_F(std::string format, const Args &... args)
{
	auto &logger = Logger::Get();
	logger.Log(false, format, args...);
	logger.Flush(false);
}


// return line (console only)
void LOG_R();

}
