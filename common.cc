#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include "common.hh"



namespace ccd2iso
{

uint32_t percentage(uint64_t value, uint64_t value_max)
{
	if(!value_max || value >= value_max)
		return 100;
	else
		return (uint32_t)(value * 100 / value_max);
}


std::string system_date_time(std::string fmt)
{
	auto time_now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
	std::stringstream ss;
	ss << std::put_time(localtime(&time_now), fmt.c_str());
	return ss.str();
}

}
