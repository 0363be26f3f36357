#include "cd.hh"



namespace ccd2iso
{

std::span<const uint8_t> SectorRecord::UserData() const
{
	if(auto mode1 = std::get_if<Mode1Content>(&content))
		return mode1->user_data;
	else if(auto mode2 = std::get_if<Mode2Content>(&content))
		return mode2->user_data;

	return {};
}


SectorRecord decode_sector(std::span<const uint8_t, CD_DATA_SIZE> buffer)
{
	MSF address;
	address.m = buffer[CD_ADDRESS_OFFSET + 0];
	address.s = buffer[CD_ADDRESS_OFFSET + 1];
	address.f = buffer[CD_ADDRESS_OFFSET + 2];

	SectorRecord sector{buffer.subspan<0, CD_SYNC_SIZE>(), address, buffer[CD_MODE_OFFSET], std::monostate()};

	if(sector.mode == SECTOR_MODE1)
	{
		sector.content = Mode1Content
		{
			buffer.subspan<MODE1_USER_DATA_OFFSET, FORM1_DATA_SIZE>(),
			buffer.subspan<MODE1_EDC_OFFSET, CD_EDC_SIZE>(),
			buffer.subspan<MODE1_INTERMEDIATE_OFFSET, MODE1_INTERMEDIATE_SIZE>(),
			buffer.subspan<MODE1_ECC_OFFSET, CD_ECC_SIZE>()
		};
	}
	else if(sector.mode == SECTOR_MODE2)
	{
		sector.content = Mode2Content
		{
			buffer.subspan<MODE2_SUBHEADER_OFFSET, MODE2_SUBHEADER_SIZE>(),
			buffer.subspan<MODE2_USER_DATA_OFFSET, FORM1_DATA_SIZE>(),
			buffer.subspan<MODE2_EDC_OFFSET, CD_EDC_SIZE>(),
			buffer.subspan<MODE2_ECC_OFFSET, CD_ECC_SIZE>()
		};
	}

	return sector;
}


MSF BCDMSF_to_MSF(MSF bcdmsf)
{
	MSF msf;
	msf.m = bcd_decode(bcdmsf.m);
	msf.s = bcd_decode(bcdmsf.s);
	msf.f = bcd_decode(bcdmsf.f);

	return msf;
}


int32_t MSF_to_LBA(MSF msf)
{
	return MSF_LIMIT.f * (MSF_LIMIT.s * msf.m + msf.s) + msf.f + MSF_LBA_SHIFT - (msf.m >= MSF_MINUTES_WRAP ? LBA_LIMIT : 0);
}


int32_t BCDMSF_to_LBA(MSF bcdmsf)
{
	return MSF_to_LBA(BCDMSF_to_MSF(bcdmsf));
}


bool MSF_valid(MSF msf)
{
	return msf.m < MSF_LIMIT.m && msf.s < MSF_LIMIT.s && msf.f < MSF_LIMIT.f;
}


bool BCDMSF_valid(MSF bcdmsf)
{
	return MSF_valid(BCDMSF_to_MSF(bcdmsf));
}

}
