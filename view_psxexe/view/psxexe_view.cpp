/*
 * PS-X EXE BinaryViewType
 *
 * ============================================================================
 * LOAD FLOW
 * ============================================================================
 *
 * IsTypeValidForData  magic plus header field block
 * Parse               header decode, platform, entry point (no segments)
 * Create + Init       full load through psxexe::LoadExecutable:
 *                       - segments/sections for RAM, code, mirrors, DATA/BSS,
 *                         scratchpad and hardware register blocks
 *                       - start function, entry point, gp default
 *                       - main() label when the SDK stub is found
 *                     then header fields go into view metadata (psxexe.*)
 *
 * Everything after the magic check is best-effort: a failed segment or label
 * is logged and the load continues.
 *
 * ============================================================================
 */

#include "psxexe_view.h"
#include "psxexe_address_space.h"
#include "loader/psxexe_loader.h"
#include "settings/loader_settings.h"
#include "settings/plugin_settings.h"

#include <algorithm>

using namespace std;
using namespace BinaryNinja;

static PsxExeViewType* g_psxExeViewType = nullptr;

void BinaryNinja::InitPsxExeViewType()
{
	static PsxExeViewType type;
	BinaryViewType::Register(&type);
	g_psxExeViewType = &type;
}

bool BinaryNinja::IsPsxExeView(BinaryView* view)
{
	return view && view->GetTypeName() == kPsxExeViewTypeName;
}

std::optional<psxexe::ExeHeader> BinaryNinja::ReadPsxExeHeader(BinaryView* view)
{
	if (!view)
		return std::nullopt;

	Ref<BinaryView> raw = view->GetParentView();
	if (!raw)
		raw = view;

	uint64_t length = std::min<uint64_t>(raw->GetLength(), psxexe::kHeaderSize);
	DataBuffer buf = raw->ReadBuffer(0, length);
	return psxexe::ParseExeHeader(static_cast<const uint8_t*>(buf.GetData()), buf.GetLength());
}

void BinaryNinja::StoreLoaderVersionInView(BinaryView* view)
{
	if (!view || !view->GetObject())
		return;
	view->StoreMetadata("psxexe.loaderVersion", new Metadata(string(psxexe::kLoaderVersion)), true);
}

PsxExeView::PsxExeView(BinaryView* data, bool parseOnly)
	: BinaryView(kPsxExeViewTypeName, data->GetFile(), data), m_parseOnly(parseOnly), m_entryPoint(0)
{
	CreateLogger("BinaryView");
	m_logger = CreateLogger("BinaryView.PsxExeView");
}

uint64_t PsxExeView::PerformGetEntryPoint() const
{
	return m_entryPoint;
}

bool PsxExeView::ResolvePlatform(const Ref<Settings>& settings)
{
	if (settings && settings->Contains(PsxExeSettings::kPlatform))
	{
		Ref<Platform> platformOverride = Platform::GetByName(settings->Get<string>(PsxExeSettings::kPlatform, this));
		if (platformOverride)
		{
			m_plat = platformOverride;
			m_arch = m_plat->GetArchitecture();
		}
	}

	if (!m_plat)
	{
		m_arch = Architecture::GetByName(kPsxExeArchitecture);
		if (m_arch)
			m_plat = m_arch->GetStandalonePlatform();
	}

	if (!m_arch || !m_plat)
	{
		m_logger->LogError("%s architecture not found", kPsxExeArchitecture);
		return false;
	}
	return true;
}

void PsxExeView::StoreHeaderMetadata(const psxexe::ExeHeader& header)
{
	auto store = [&](const char* key, uint64_t value) {
		StoreMetadata(string("psxexe.header.") + key, new Metadata(value), true);
	};

	store("initialPc", header.initialPc);
	store("initialGp", header.initialGp);
	store("loadAddress", header.loadAddress);
	store("codeSize", header.codeSize);
	store("dataAddress", header.dataAddress);
	store("dataSize", header.dataSize);
	store("bssAddress", header.bssAddress);
	store("bssSize", header.bssSize);
	store("stackBase", header.stackBase);
	store("stackOffset", header.stackOffset);

	if (!header.marker.empty())
	{
		StoreMetadata("psxexe.marker", new Metadata(header.marker), true);
		const char* region = psxexe::GetMarkerRegionName(psxexe::GetMarkerRegion(header.marker));
		if (region[0])
			StoreMetadata("psxexe.region", new Metadata(string(region)), true);
	}

	StoreLoaderVersionInView(this);
}

bool PsxExeView::Init()
{
	Ref<BinaryView> parent = GetParentView();
	uint64_t length = parent->GetLength();

	DataBuffer headerBuf = parent->ReadBuffer(0, std::min<uint64_t>(length, psxexe::kHeaderSize));
	const uint8_t* headerData = static_cast<const uint8_t*>(headerBuf.GetData());
	size_t headerLen = headerBuf.GetLength();

	auto header = psxexe::ParseExeHeader(headerData, headerLen);
	if (!header)
	{
		m_logger->LogError("Not a PS-X EXE: bad magic or header shorter than 0x38 bytes");
		return false;
	}

	Ref<Settings> settings = GetLoadSettings(GetTypeName());
	if (!ResolvePlatform(settings))
		return false;

	SetDefaultArchitecture(m_arch);
	SetDefaultPlatform(m_plat);
	m_entryPoint = header->initialPc;

	// Finished for parse-only mode
	if (m_parseOnly)
		return true;

	psxexe::LoadOptions options = LoadLoaderSettings(settings, this, m_logger);
	if (options.verbose)
		LogLoaderSettingsSummary(m_logger, options);

	PsxExeAddressSpace space(this, m_plat, m_logger);
	LoggerDiagnostics diag(m_logger);
	psxexe::LoadReport report;
	try
	{
		report = psxexe::LoadExecutable(headerData, headerLen, length, space, diag, options);
	}
	catch (std::exception& e)
	{
		m_logger->LogErrorForException(e, "PS-X EXE load failed: %s", e.what());
		return false;
	}

	if (!report.Parsed())
		return false;

	StoreHeaderMetadata(*header);

	if (report.cancelled)
		m_logger->LogWarn("PS-X EXE load cancelled; the view is incomplete");
	return true;
}

PsxExeViewType::PsxExeViewType()
	: BinaryViewType(kPsxExeViewTypeName, kPsxExeViewTypeName)
{
	m_logger = LogRegistry::CreateLogger("BinaryView.PsxExeViewType");
}

Ref<BinaryView> PsxExeViewType::Create(BinaryView* data)
{
	try
	{
		return new PsxExeView(data);
	}
	catch (std::exception& e)
	{
		m_logger->LogErrorForException(
			e, "%s<BinaryViewType> failed to create view! '%s'", GetName().c_str(), e.what());
		return nullptr;
	}
}

Ref<BinaryView> PsxExeViewType::Parse(BinaryView* data)
{
	try
	{
		return new PsxExeView(data, true);
	}
	catch (std::exception& e)
	{
		m_logger->LogErrorForException(
			e, "%s<BinaryViewType> failed to create view! '%s'", GetName().c_str(), e.what());
		return nullptr;
	}
}

bool PsxExeViewType::IsTypeValidForData(BinaryView* data)
{
	if (!data || data->GetLength() < psxexe::HeaderOffsets::kFieldsEnd)
		return false;

	DataBuffer buf = data->ReadBuffer(0, psxexe::HeaderOffsets::kFieldsEnd);
	return psxexe::IsExeCandidate(static_cast<const uint8_t*>(buf.GetData()), buf.GetLength());
}

Ref<Settings> PsxExeViewType::GetLoadSettingsForData(BinaryView* data)
{
	Ref<BinaryView> viewRef = Parse(data);
	if (!viewRef || !viewRef->Init())
	{
		m_logger->LogDebug("Parse failed, using default load settings");
		viewRef = data;
	}

	Ref<Settings> settings = GetDefaultLoadSettingsForData(viewRef);
	RegisterLoaderSettings(settings);

	if (settings->Contains(PsxExeSettings::kPlatform))
		settings->UpdateProperty(PsxExeSettings::kPlatform, "readOnly", false);

	return settings;
}
