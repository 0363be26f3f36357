#pragma once



#include <list>
#include <string>



namespace ccd2iso
{

struct Options
{
	std::string command_line;

	std::list<std::string> positional;

	bool help;
	bool version;
	bool verbose;
	bool quiet;
	bool force;
	std::string log_file;

	Options(int argc, const char *argv[]);

	void PrintUsage();
};

}
