#include <exception>
#include "ccd2iso.hh"
#include "logger.hh"
#include "options.hh"



using namespace ccd2iso;



int main(int argc, char *argv[])
{
	int exit_code = 0;

	try
	{
		Options options(argc, const_cast<const char **>(argv));

		if(options.help)
			options.PrintUsage();
		else if(options.version)
			LOG("{}", ccd2iso_version());
		else
			exit_code = convert_image(options);
	}
	catch(const std::exception &e)
	{
		LOG("error: {}", e.what());
		exit_code = -1;
	}
	catch(...)
	{
		LOG("error: unhandled exception");
		exit_code = -2;
	}

	return exit_code;
}
