/*
 * PS-X EXE Binary Ninja Address Space - Implementation
 *
 * Segments created here never overlap: Binary Ninja would silently let a later
 * segment shadow an earlier one, so overlap is detected up front and reported
 * back to the loader as a failed request.
 *
 * Mirrors are separate segments pointing at the same file range as their base.
 * Binary Ninja has no aliasing segments, so writes made through one view of
 * RAM are not visible through the others.
 */

#include "psxexe_address_space.h"
#include "common/psxexe_utils.h"

#include <algorithm>
#include <cstdio>

using namespace BinaryNinja;
using namespace std;

void LoggerDiagnostics::Emit(psxexe::DiagnosticLevel level, const string& message)
{
	if (!m_logger)
		return;

	switch (level)
	{
	case psxexe::DiagnosticLevel::Debug:
		m_logger->LogDebug("%s", message.c_str());
		break;
	case psxexe::DiagnosticLevel::Info:
		m_logger->LogInfo("%s", message.c_str());
		break;
	case psxexe::DiagnosticLevel::Warning:
		m_logger->LogWarn("%s", message.c_str());
		break;
	case psxexe::DiagnosticLevel::Error:
		m_logger->LogError("%s", message.c_str());
		break;
	}
}

uint32_t BinaryNinja::ToSegmentFlags(uint32_t regionFlags)
{
	uint32_t flags = 0;
	if (regionFlags & psxexe::RegionReadable)
		flags |= SegmentReadable;
	if (regionFlags & psxexe::RegionWritable)
		flags |= SegmentWritable;
	if (regionFlags & psxexe::RegionExecutable)
		flags |= SegmentExecutable | SegmentContainsCode;
	else
		flags |= SegmentContainsData;
	return flags;
}

PsxExeAddressSpace::PsxExeAddressSpace(BinaryView* view, Ref<Platform> plat, Ref<Logger> logger,
	std::function<bool()> cancelled)
	: m_view(view), m_plat(plat), m_logger(logger), m_cancelled(std::move(cancelled))
{
	if (m_plat)
		m_arch = m_plat->GetArchitecture();
}

bool PsxExeAddressSpace::IsCancelled() const
{
	if (BNIsShutdownRequested())
		return true;
	return m_cancelled && m_cancelled();
}

bool PsxExeAddressSpace::Overlaps(uint64_t start, uint64_t size, string& error) const
{
	const uint64_t end = start + size;
	for (const auto& segment : m_view->GetSegments())
	{
		if (start < segment->GetEnd() && segment->GetStart() < end)
		{
			char buf[96];
			snprintf(buf, sizeof(buf), "overlaps segment 0x%08llx-0x%08llx",
				(unsigned long long)segment->GetStart(), (unsigned long long)segment->GetEnd());
			error = buf;
			return true;
		}
	}
	return false;
}

bool PsxExeAddressSpace::LookupRegion(uint64_t start, RegionRecord& out) const
{
	auto it = m_regions.find(start);
	if (it == m_regions.end())
		return false;
	out = it->second;
	return true;
}

bool PsxExeAddressSpace::CreateRegion(const string& name, uint64_t start, uint64_t size, uint32_t flags,
	uint64_t fileOffset, uint64_t fileLength, string& error)
{
	if (size == 0)
	{
		error = "zero size";
		return false;
	}
	if (fileLength > size)
		fileLength = size;

	try
	{
		if (Overlaps(start, size, error))
			return false;

		m_view->AddAutoSegment(start, size, fileOffset, fileLength, ToSegmentFlags(flags));
		m_regions[start] = {name, start, size, flags, fileOffset, fileLength};
		m_logger->LogDebug("Segment %s 0x%08llx-0x%08llx %s", name.c_str(), (unsigned long long)start,
			(unsigned long long)(start + size), psxexe::FormatRegionFlags(flags).c_str());
		return true;
	}
	catch (std::exception& e)
	{
		error = e.what();
		return false;
	}
}

bool PsxExeAddressSpace::CreateMirror(const string& name, uint64_t baseStart, uint64_t start, uint64_t size,
	string& error)
{
	RegionRecord base;
	if (!LookupRegion(baseStart, base))
	{
		error = "unknown mirror base";
		return false;
	}
	if (size == 0)
	{
		error = "zero size";
		return false;
	}

	try
	{
		if (Overlaps(start, size, error))
			return false;

		uint64_t dataLength = std::min(base.fileLength, size);
		m_view->AddAutoSegment(start, size, base.fileOffset, dataLength, ToSegmentFlags(base.flags));
		m_logger->LogDebug("Mirror %s 0x%08llx-0x%08llx of %s", name.c_str(), (unsigned long long)start,
			(unsigned long long)(start + size), base.name.c_str());
		return true;
	}
	catch (std::exception& e)
	{
		error = e.what();
		return false;
	}
}

bool PsxExeAddressSpace::CreateSection(const string& name, uint64_t start, uint64_t size, psxexe::SectionKind kind,
	string& error)
{
	try
	{
		BNSectionSemantics semantics = (kind == psxexe::SectionKind::Code) ? ReadOnlyCodeSectionSemantics
			: ReadWriteDataSectionSemantics;
		m_view->AddAutoSection(name, start, size, semantics);
		return true;
	}
	catch (std::exception& e)
	{
		error = e.what();
		return false;
	}
}

bool PsxExeAddressSpace::FindRegion(uint64_t address, uint64_t& start, uint64_t& end) const
{
	Ref<Segment> segment = m_view->GetSegmentAt(address);
	if (!segment)
		return false;
	start = segment->GetStart();
	end = segment->GetEnd();
	return true;
}

size_t PsxExeAddressSpace::Read(uint64_t address, size_t length, vector<uint8_t>& out) const
{
	out.clear();
	try
	{
		DataBuffer buf = m_view->ReadBuffer(address, length);
		const uint8_t* data = static_cast<const uint8_t*>(buf.GetData());
		if (data)
			out.assign(data, data + buf.GetLength());
	}
	catch (ReadException& e)
	{
		m_logger->LogDebug("Read at 0x%08llx failed: %s", (unsigned long long)address, e.what());
		out.clear();
	}
	return out.size();
}

bool PsxExeAddressSpace::DecodeReferences(uint64_t address, vector<uint64_t>& references, string& error)
{
	references.clear();
	if (!m_arch)
	{
		error = "no architecture";
		return false;
	}

	vector<uint8_t> bytes;
	size_t maxLength = m_arch->GetMaxInstructionLength();
	if (Read(address, maxLength, bytes) == 0)
	{
		error = "address not readable";
		return false;
	}

	InstructionInfo info;
	if (!m_arch->GetInstructionInfo(bytes.data(), address, bytes.size(), info))
	{
		error = "invalid instruction";
		return false;
	}

	for (size_t i = 0; i < info.branchCount; i++)
	{
		switch (info.branchType[i])
		{
		case CallDestination:
		case UnconditionalBranch:
		case TrueBranch:
			references.push_back(info.branchTarget[i]);
			break;
		default:
			break;
		}
	}

	// Non-branch forms still carry their target as an address token
	if (references.empty())
	{
		size_t length = bytes.size();
		vector<InstructionTextToken> tokens;
		if (m_arch->GetInstructionText(bytes.data(), address, length, tokens))
		{
			for (const auto& token : tokens)
			{
				if (token.type == PossibleAddressToken || token.type == CodeRelativeAddressToken)
					references.push_back(token.value);
			}
		}
	}
	return true;
}

bool PsxExeAddressSpace::DefineLabel(uint64_t address, const string& name, psxexe::SymbolKind kind,
	string& error)
{
	try
	{
		BNSymbolType type = (kind == psxexe::SymbolKind::Function) ? FunctionSymbol : DataSymbol;
		m_view->DefineAutoSymbol(new Symbol(type, name, address, GlobalBinding));
		return true;
	}
	catch (std::exception& e)
	{
		error = e.what();
		return false;
	}
}

bool PsxExeAddressSpace::DefineData(uint64_t address, uint8_t width, uint32_t count, string& error)
{
	if (width != 8 && width != 16 && width != 32)
	{
		error = "unsupported width";
		return false;
	}

	try
	{
		Ref<Type> type = Type::IntegerType(width / 8, false);
		if (count > 1)
			type = Type::ArrayType(type, count);
		m_view->DefineDataVariable(address, type);
		return true;
	}
	catch (std::exception& e)
	{
		error = e.what();
		return false;
	}
}

bool PsxExeAddressSpace::CreateFunction(uint64_t address, string& error)
{
	if (!m_plat)
	{
		error = "no platform";
		return false;
	}
	m_view->AddFunctionForAnalysis(m_plat, address);
	return true;
}

bool PsxExeAddressSpace::AddEntryPoint(uint64_t address, string& error)
{
	if (!m_plat)
	{
		error = "no platform";
		return false;
	}
	m_view->AddEntryPointForAnalysis(m_plat, address);
	return true;
}

bool PsxExeAddressSpace::SetRegisterDefault(const string& reg, uint64_t value, string& error)
{
	try
	{
		if (reg == "gp")
		{
			RegisterValue gp;
			gp.state = ConstantValue;
			gp.value = static_cast<int64_t>(value);
			m_view->SetUserGlobalPointerValue(Confidence<RegisterValue>(gp));
			return true;
		}

		// No per-view stack pointer default in the core; keep it for scripts
		if (reg == "sp")
		{
			m_view->StoreMetadata(kStackPointerMetadataKey, new Metadata(value), true);
			return true;
		}
	}
	catch (std::exception& e)
	{
		error = e.what();
		return false;
	}

	error = "unsupported register " + reg;
	return false;
}
