#include <fmt/format.h>
#include "common.hh"
#include "logger.hh"
#include "options.hh"



namespace ccd2iso
{

Options::Options(int argc, const char *argv[])
	: help(false)
	, version(false)
	, verbose(false)
	, quiet(false)
	, force(false)
{
	for(int i = 0; i < argc; ++i)
	{
		std::string argument = argv[i];

		bool quoted = false;
		if(argument.find(' ') != std::string::npos)
			quoted = true;

		command_line += fmt::format("{}{}{}{}", quoted ? "\"" : "", argument, quoted ? "\"" : "", i + 1 == argc ? "" : " ");
	}

	// no arguments at all, same as --help
	if(argc < 2)
		help = true;

	std::string *s_value = nullptr;
	for(int i = 1; i < argc; ++i)
	{
		std::string o(argv[i]);

		// option
		if(o.size() > 1 && o[0] == '-')
		{
			std::string key;
			auto value_pos = o.find("=");
			if(value_pos == std::string::npos)
			{
				key = o;
				o.clear();
			}
			else
			{
				key = std::string(o, 0, value_pos);
				o = std::string(o, value_pos + 1);
			}

			if(s_value == nullptr)
			{
				bool flag = true;
				if(key == "--help" || key == "-h" || key == "-?")
					help = true;
				else if(key == "--version" || key == "-v")
					version = true;
				else if(key == "--verbose")
					verbose = true;
				else if(key == "--quiet")
					quiet = true;
				else if(key == "--force" || key == "-f")
					force = true;
				else if(key == "--log-file")
				{
					s_value = &log_file;
					flag = false;
				}
				// unknown option
				else
				{
					throw_line("unknown option ({})", key);
				}

				if(flag && !o.empty())
					throw_line("option doesn't take a value ({})", key);
			}
			else
				throw_line("option value expected ({})", argv[i - 1]);
		}

		if(!o.empty())
		{
			if(s_value != nullptr)
			{
				*s_value = o;
				s_value = nullptr;
			}
			else
				positional.emplace_back(o);
		}
	}

	if(s_value != nullptr)
		throw_line("option value expected ({})", argv[argc - 1]);
}


void Options::PrintUsage()
{
	LOG("usage: ccd2iso [options] img [iso]");
	LOG("");
	LOG("Convert CloneCD .img files to ISO 9660 .iso files.");
	LOG("");

	LOG("ARGUMENTS:");
	LOG("\timg                            \t.img file to convert");
	LOG("\tiso                            \tfilepath for the output .iso file, .img file path with .iso extension if not provided");
	LOG("");

	LOG("OPTIONS:");
	LOG("\t--help,-h,-?                   \tprint usage");
	LOG("\t--version,-v                   \tprint version");
	LOG("\t--force,-f                     \toverwrite the .iso file if it already exists");
	LOG("\t--verbose                      \tverbose output");
	LOG("\t--quiet                        \tdon't display conversion progress");
	LOG("\t--log-file=VALUE               \tappend output to the log file");
}

}
