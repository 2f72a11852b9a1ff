/*
 * PS-X EXE BinaryViewType
 *
 * BinaryViewType for PlayStation executables. Detects the "PS-X EXE" magic
 * at offset 0 and builds the console's memory map around the code image.
 */

#pragma once

#include "binaryninjaapi.h"
#include "loader/exe_header.h"

#include <optional>

namespace BinaryNinja
{
	constexpr const char* kPsxExeViewTypeName = "PS-X EXE";
	constexpr const char* kPsxExeArchitecture = "mipsel32";

	class PsxExeView: public BinaryView
	{
		bool m_parseOnly;
		uint64_t m_entryPoint;
		Ref<Architecture> m_arch;
		Ref<Platform> m_plat;
		Ref<Logger> m_logger;

		virtual uint64_t PerformGetEntryPoint() const override;
		virtual bool PerformIsExecutable() const override { return true; }
		virtual BNEndianness PerformGetDefaultEndianness() const override { return LittleEndian; }
		virtual bool PerformIsRelocatable() const override { return false; }
		virtual size_t PerformGetAddressSize() const override { return 4; }

		bool ResolvePlatform(const Ref<Settings>& settings);
		void StoreHeaderMetadata(const psxexe::ExeHeader& header);

	public:
		PsxExeView(BinaryView* data, bool parseOnly = false);
		virtual bool Init() override;
	};

	class PsxExeViewType: public BinaryViewType
	{
		Ref<Logger> m_logger;
	public:
		PsxExeViewType();
		virtual Ref<BinaryView> Create(BinaryView* data) override;
		virtual Ref<BinaryView> Parse(BinaryView* data) override;
		virtual bool IsTypeValidForData(BinaryView* data) override;
		virtual bool IsForceLoadable() override { return false; }
		virtual Ref<Settings> GetLoadSettingsForData(BinaryView* data) override;
	};

	void InitPsxExeViewType();
	bool IsPsxExeView(BinaryView* view);

	/**
	 * Re-read and decode the header from a view's raw parent.
	 */
	std::optional<psxexe::ExeHeader> ReadPsxExeHeader(BinaryView* view);

	// Stores the loader version under psxexe.loaderVersion
	void StoreLoaderVersionInView(BinaryView* view);
}
