#pragma once



#include <cstdint>
#include <span>
#include <variant>



namespace ccd2iso
{

struct MSF
{
	union
	{
		struct
		{
			uint8_t m;
			uint8_t s;
			uint8_t f;
		};
		uint8_t raw[3];
	};
};

// CloneCD raw sector
// -----------------------------------------------------
//        0  1  2  3  4  5  6  7  8  9  A  B  C  D  E  F
// 0000h 00 FF FF FF FF FF FF FF FF FF FF 00 [-ADDR-] MM
// 0010h [---DATA...                                 mode 1
// 0010h [------SUBHEADER-------] [---DATA...        mode 2
// ...
// 0920h                                      ...ECC---]
// -----------------------------------------------------
inline constexpr uint32_t CD_DATA_SIZE = 2352;
inline constexpr uint32_t CD_SYNC_SIZE = 12;
inline constexpr uint32_t CD_HEADER_SIZE = 16;
inline constexpr uint32_t CD_CONTENT_SIZE = CD_DATA_SIZE - CD_HEADER_SIZE;
inline constexpr uint32_t CD_EDC_SIZE = 4;
inline constexpr uint32_t CD_ECC_SIZE = 276;

inline constexpr uint32_t FORM1_DATA_SIZE = 2048;
inline constexpr uint32_t MODE1_INTERMEDIATE_SIZE = 8;
inline constexpr uint32_t MODE2_SUBHEADER_SIZE = 8;

inline constexpr uint32_t CD_ADDRESS_OFFSET = CD_SYNC_SIZE;
inline constexpr uint32_t CD_MODE_OFFSET = CD_ADDRESS_OFFSET + 3;

inline constexpr uint32_t MODE1_USER_DATA_OFFSET = CD_HEADER_SIZE;
inline constexpr uint32_t MODE1_EDC_OFFSET = MODE1_USER_DATA_OFFSET + FORM1_DATA_SIZE;
inline constexpr uint32_t MODE1_INTERMEDIATE_OFFSET = MODE1_EDC_OFFSET + CD_EDC_SIZE;
inline constexpr uint32_t MODE1_ECC_OFFSET = MODE1_INTERMEDIATE_OFFSET + MODE1_INTERMEDIATE_SIZE;

inline constexpr uint32_t MODE2_SUBHEADER_OFFSET = CD_HEADER_SIZE;
inline constexpr uint32_t MODE2_USER_DATA_OFFSET = MODE2_SUBHEADER_OFFSET + MODE2_SUBHEADER_SIZE;
inline constexpr uint32_t MODE2_EDC_OFFSET = MODE2_USER_DATA_OFFSET + FORM1_DATA_SIZE;
inline constexpr uint32_t MODE2_ECC_OFFSET = MODE2_EDC_OFFSET + CD_EDC_SIZE;

static_assert(MODE1_ECC_OFFSET + CD_ECC_SIZE == CD_DATA_SIZE);
static_assert(MODE2_ECC_OFFSET + CD_ECC_SIZE == CD_DATA_SIZE);

inline constexpr uint8_t SECTOR_MODE1 = 1;
inline constexpr uint8_t SECTOR_MODE2 = 2;
// CloneCD stores this mode value in the sectors separating two sessions
inline constexpr uint8_t SECTOR_MODE_SESSION_MARKER = 0xE2;

inline constexpr uint8_t CD_DATA_SYNC[] =
{
	0x00, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0x00
};

inline constexpr uint32_t MSF_MINUTES_WRAP = 90;
inline constexpr MSF MSF_LIMIT = {100, 60, 75};
inline constexpr int32_t MSF_LBA_SHIFT = -150;

inline constexpr uint32_t LBA_LIMIT = MSF_LIMIT.m * MSF_LIMIT.s * MSF_LIMIT.f;

struct Mode1Content
{
	std::span<const uint8_t, FORM1_DATA_SIZE> user_data;
	std::span<const uint8_t, CD_EDC_SIZE> edc;
	std::span<const uint8_t, MODE1_INTERMEDIATE_SIZE> intermediate;
	std::span<const uint8_t, CD_ECC_SIZE> ecc;
};

struct Mode2Content
{
	std::span<const uint8_t, MODE2_SUBHEADER_SIZE> sub_header;
	std::span<const uint8_t, FORM1_DATA_SIZE> user_data;
	std::span<const uint8_t, CD_EDC_SIZE> edc;
	std::span<const uint8_t, CD_ECC_SIZE> ecc;
};

// non-owning view of a raw sector buffer, valid as long as the buffer is
struct SectorRecord
{
	std::span<const uint8_t, CD_SYNC_SIZE> sync;
	MSF address;
	uint8_t mode;

	// std::monostate for every mode without a user data layout
	std::variant<std::monostate, Mode1Content, Mode2Content> content;

	std::span<const uint8_t> UserData() const;
};

SectorRecord decode_sector(std::span<const uint8_t, CD_DATA_SIZE> buffer);

template<typename T>
constexpr T bcd_decode(T value)
{
	return value / 0x10 * 10 + value % 0x10;
}


MSF BCDMSF_to_MSF(MSF bcdmsf);
int32_t MSF_to_LBA(MSF msf);
int32_t BCDMSF_to_LBA(MSF bcdmsf);
bool MSF_valid(MSF msf);
bool BCDMSF_valid(MSF bcdmsf);

}
