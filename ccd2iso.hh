#pragma once



#include <string>
#include "options.hh"



namespace ccd2iso
{

std::string ccd2iso_version();

// returns process exit code, conversion failures are reported here,
// everything else is thrown
int convert_image(const Options &options);

}
