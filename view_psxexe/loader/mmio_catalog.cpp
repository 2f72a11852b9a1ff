/*
 * PS-X EXE Hardware Register Catalog - Implementation
 */

#include "mmio_catalog.h"
#include "common/diagnostics.h"

#include <algorithm>

namespace psxexe {

static MmioRegister Reg8(const char* name, uint32_t offset)
{
	return {name, offset, 8, 1, 0};
}

static MmioRegister Reg16(const char* name, uint32_t offset)
{
	return {name, offset, 16, 1, 0};
}

static MmioRegister Reg32(const char* name, uint32_t offset)
{
	return {name, offset, 32, 1, 0};
}

// ============================================================================
// Memory control / peripheral ports / interrupts
// ============================================================================

static void AddMemoryControlBlocks(std::vector<MmioBlock>& catalog)
{
	{
		MmioBlock b;
		b.name = "MCTRL1";
		b.base = 0x1F801000;
		b.size = 0x24;
		b.registers = {
			Reg32("EXP1_BASE_ADDR", 0x00),
			Reg32("EXP2_BASE_ADDR", 0x04),
			Reg32("EXP1_DELAY_SIZE", 0x08),
			Reg32("EXP3_DELAY_SIZE", 0x0C),
			Reg32("BIOS_ROM", 0x10),
			Reg32("SPU_DELAY", 0x14),
			Reg32("CDROM_DELAY", 0x18),
			Reg32("EXP2_DELAY_SIZE", 0x1C),
			Reg32("COMMON_DELAY", 0x20),
		};
		catalog.push_back(b);
	}

	{
		MmioBlock b;
		b.name = "MCTRL2";
		b.base = 0x1F801060;
		b.size = 0x04;
		b.registers = {Reg32("RAM_SIZE", 0x00)};
		catalog.push_back(b);
	}
}

static void AddPortBlocks(std::vector<MmioBlock>& catalog)
{
	// Joypad/memory card (SIO0) and serial port (SIO1)
	{
		MmioBlock b;
		b.name = "IO_PORTS";
		b.base = 0x1F801040;
		b.size = 0x20;
		b.registers = {
			Reg32("JOY_MCD_DATA", 0x00),
			Reg32("JOY_MCD_STAT", 0x04),
			Reg16("JOY_MCD_MODE", 0x08),
			Reg16("JOY_MCD_CTRL", 0x0A),
			Reg16("JOY_MCD_BAUD", 0x0E),
			Reg32("SIO_DATA", 0x10),
			Reg32("SIO_STAT", 0x14),
			Reg16("SIO_MODE", 0x18),
			Reg16("SIO_CTRL", 0x1A),
			Reg16("SIO_MISC", 0x1C),
			Reg16("SIO_BAUD", 0x1E),
		};
		catalog.push_back(b);
	}

	{
		MmioBlock b;
		b.name = "INT_CTRL";
		b.base = 0x1F801070;
		b.size = 0x06;
		b.registers = {
			Reg16("I_STAT", 0x00),
			Reg16("I_MASK", 0x04),
		};
		catalog.push_back(b);
	}
}

// ============================================================================
// DMA channels and timers
// ============================================================================

static void AddDmaBlocks(std::vector<MmioBlock>& catalog)
{
	static const char* const kChannels[] = {
		"DMA_MDEC_IN", "DMA_MDEC_OUT", "DMA_GPU", "DMA_CDROM", "DMA_SPU", "DMA_PIO", "DMA_OTC"
	};

	uint32_t base = 0x1F801080;
	for (const char* channel : kChannels)
	{
		MmioBlock b;
		b.name = channel;
		b.base = base;
		b.size = 0x0C;
		b.elementPrefix = channel;
		b.registers = {
			Reg32("MADR", 0x00),
			Reg32("BCR", 0x04),
			Reg32("CHCR", 0x08),
		};
		catalog.push_back(b);
		base += 0x10;
	}

	MmioBlock ctrl;
	ctrl.name = "DMA_CTRL_INT";
	ctrl.base = 0x1F8010F0;
	ctrl.size = 0x08;
	ctrl.registers = {
		Reg32("DMA_DPCR", 0x00),
		Reg32("DMA_DICR", 0x04),
	};
	catalog.push_back(ctrl);
}

static void AddTimerBlocks(std::vector<MmioBlock>& catalog)
{
	static const char* const kTimers[] = {"TMR_DOTCLOCK", "TMR_HRETRACE", "TMR_SYSCLOCK"};

	uint32_t base = 0x1F801100;
	for (const char* timer : kTimers)
	{
		MmioBlock b;
		b.name = timer;
		b.base = base;
		b.size = 0x10;
		b.elementPrefix = timer;
		b.registers = {
			Reg32("VAL", 0x00),
			Reg32("MODE", 0x04),
			Reg32("MAX", 0x08),
		};
		catalog.push_back(b);
		base += 0x10;
	}
}

// ============================================================================
// CD-ROM, GPU, MDEC, SPU
// ============================================================================

static void AddMediaBlocks(std::vector<MmioBlock>& catalog)
{
	{
		MmioBlock b;
		b.name = "CDROM_REGS";
		b.base = 0x1F801800;
		b.size = 0x04;
		b.registers = {
			Reg8("CDROM_REG0", 0x00),
			Reg8("CDROM_REG1", 0x01),
			Reg8("CDROM_REG2", 0x02),
			Reg8("CDROM_REG3", 0x03),
		};
		catalog.push_back(b);
	}

	{
		MmioBlock b;
		b.name = "GPU_REGS";
		b.base = 0x1F801810;
		b.size = 0x08;
		b.registers = {
			Reg32("GPU_REG0", 0x00),
			Reg32("GPU_REG1", 0x04),
		};
		catalog.push_back(b);
	}

	{
		MmioBlock b;
		b.name = "MDEC_REGS";
		b.base = 0x1F801820;
		b.size = 0x08;
		b.registers = {
			Reg32("MDEC_REG0", 0x00),
			Reg32("MDEC_REG1", 0x04),
		};
		catalog.push_back(b);
	}
}

static void AddSpuBlocks(std::vector<MmioBlock>& catalog)
{
	// 24 voices, 0x10 bytes each; +0x0A is unused in every voice
	constexpr uint32_t kVoiceCount = 24;
	constexpr uint32_t kVoiceStride = 0x10;
	{
		MmioBlock b;
		b.name = "SPU_VOICES";
		b.base = 0x1F801C00;
		b.size = kVoiceCount * kVoiceStride;
		b.elementPrefix = "VOICE";
		b.registers = {
			{"LEFT_RIGHT", 0x00, 32, kVoiceCount, kVoiceStride},
			{"ADPCM_SAMPLE_RATE", 0x04, 16, kVoiceCount, kVoiceStride},
			{"ADPCM_START_ADDR", 0x06, 16, kVoiceCount, kVoiceStride},
			{"ADSR_ATT_DEC_SUS_REL", 0x08, 16, kVoiceCount, kVoiceStride},
			{"ADSR_CURR_VOLUME", 0x0C, 16, kVoiceCount, kVoiceStride},
			{"ADPCM_REPEAT_ADDR", 0x0E, 16, kVoiceCount, kVoiceStride},
		};
		catalog.push_back(b);
	}

	{
		MmioBlock b;
		b.name = "SPU_CTRL_REGS";
		b.base = 0x1F801D80;
		b.size = 0x40;
		b.registers = {
			Reg16("SPU_MAIN_VOL_L", 0x00),
			Reg16("SPU_MAIN_VOL_R", 0x02),
			Reg16("SPU_REVERB_OUT_L", 0x04),
			Reg16("SPU_REVERB_OUT_R", 0x06),
			Reg32("SPU_VOICE_KEY_ON", 0x08),
			Reg32("SPU_VOICE_KEY_OFF", 0x0C),
			Reg32("SPU_VOICE_CHN_FM_MODE", 0x10),
			Reg32("SPU_VOICE_CHN_NOISE_MODE", 0x14),
			Reg32("SPU_VOICE_CHN_REVERB_MODE", 0x18),
			Reg32("SPU_VOICE_CHN_ON_OFF_STATUS", 0x1C),
			Reg16("SPU_UNKN_1DA0", 0x20),
			Reg16("SOUND_RAM_REVERB_WORK_ADDR", 0x22),
			Reg16("SOUND_RAM_IRQ_ADDR", 0x24),
			Reg16("SOUND_RAM_DATA_TRANSFER_ADDR", 0x26),
			Reg16("SOUND_RAM_DATA_TRANSFER_FIFO", 0x28),
			Reg16("SPU_CTRL_REG_CPUCNT", 0x2A),
			Reg16("SOUND_RAM_DATA_TRANSTER_CTRL", 0x2C),
			Reg16("SPU_STATUS_REG_SPUSTAT", 0x2E),
			Reg16("CD_VOL_L", 0x30),
			Reg16("CD_VOL_R", 0x32),
			Reg16("EXT_VOL_L", 0x34),
			Reg16("EXT_VOL_R", 0x36),
			Reg16("CURR_MAIN_VOL_L", 0x38),
			Reg16("CURR_MAIN_VOL_R", 0x3A),
			Reg32("SPU_UNKN_1DBC", 0x3C),
		};
		catalog.push_back(b);
	}
}

static std::vector<MmioBlock> BuildCatalog()
{
	std::vector<MmioBlock> catalog;
	AddMemoryControlBlocks(catalog);
	AddPortBlocks(catalog);
	AddDmaBlocks(catalog);
	AddTimerBlocks(catalog);
	AddMediaBlocks(catalog);
	AddSpuBlocks(catalog);
	return catalog;
}

const std::vector<MmioBlock>& GetMmioCatalog()
{
	static const std::vector<MmioBlock> catalog = BuildCatalog();
	return catalog;
}

const MmioBlock* FindMmioBlock(uint32_t address)
{
	for (const auto& block : GetMmioCatalog())
	{
		if (address >= block.base && address - block.base < block.size)
			return &block;
	}
	return nullptr;
}

std::string GetRegisterLabel(const MmioBlock& block, const MmioRegister& reg, uint32_t index)
{
	if (reg.repeatCount > 1)
		return FormatString("%s_%02x_%s", block.elementPrefix.c_str(), index, reg.name.c_str());
	if (!block.elementPrefix.empty())
		return block.elementPrefix + "_" + reg.name;
	return reg.name;
}

/*
 * Filler naming follows the repeated bank layout when the block has one, so
 * the gap at +0x0A of voice 3 is "VOICE_03_RSVD_0A" rather than an offset
 * relative to the whole bank.
 */
static uint32_t GetElementStride(const MmioBlock& block)
{
	for (const auto& reg : block.registers)
	{
		if (reg.repeatCount > 1 && reg.stride != 0)
			return reg.stride;
	}
	return 0;
}

static RegisterDefinition MakeFiller(const MmioBlock& block, uint32_t stride, uint32_t start, uint32_t length)
{
	RegisterDefinition def;
	if (stride != 0)
		def.name = FormatString("%s_%02x_RSVD_%02X", block.elementPrefix.c_str(), start / stride, start % stride);
	else
		def.name = FormatString("%s_RSVD_%02X", block.name.c_str(), start);
	def.address = block.base + start;
	def.width = 8;
	def.count = length;
	def.reserved = true;
	return def;
}

std::vector<RegisterDefinition> ExpandMmioBlock(const MmioBlock& block, bool includeReserved)
{
	std::vector<RegisterDefinition> result;
	std::vector<bool> covered(block.size, false);

	for (const auto& reg : block.registers)
	{
		uint32_t bytes = reg.width / 8;
		uint32_t repeat = (reg.repeatCount == 0) ? 1 : reg.repeatCount;
		for (uint32_t i = 0; i < repeat; i++)
		{
			uint32_t offset = reg.offset + i * reg.stride;
			if (offset + bytes > block.size)
				break;

			RegisterDefinition def;
			def.name = GetRegisterLabel(block, reg, i);
			def.address = block.base + offset;
			def.width = reg.width;
			def.count = 1;
			def.reserved = false;
			result.push_back(def);

			for (uint32_t b = 0; b < bytes; b++)
				covered[offset + b] = true;
		}
	}

	if (includeReserved)
	{
		uint32_t stride = GetElementStride(block);
		uint32_t offset = 0;
		while (offset < block.size)
		{
			if (covered[offset])
			{
				offset++;
				continue;
			}

			uint32_t start = offset;
			while (offset < block.size && !covered[offset])
			{
				offset++;
				if (stride != 0 && (offset % stride) == 0)
					break;
			}
			result.push_back(MakeFiller(block, stride, start, offset - start));
		}
	}

	std::sort(result.begin(), result.end(),
		[](const RegisterDefinition& a, const RegisterDefinition& b) { return a.address < b.address; });
	return result;
}

} /* namespace psxexe */
