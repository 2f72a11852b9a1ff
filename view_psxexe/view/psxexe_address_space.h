/*
 * PS-X EXE Binary Ninja Address Space
 *
 * Binary Ninja implementation of the loader's AddressSpace capability:
 * regions become auto segments, mirrors become extra segments backed by the
 * same file bytes as their base, labels become auto symbols and register
 * definitions become typed data variables.
 */

#pragma once

#include "binaryninjaapi.h"
#include "loader/address_space.h"
#include "common/diagnostics.h"

#include <functional>
#include <map>
#include <string>
#include <vector>

namespace BinaryNinja
{
	constexpr const char* kStackPointerMetadataKey = "psxexe.context.sp";

	/*
	 * Forwards loader diagnostics to a Binary Ninja logger.
	 */
	class LoggerDiagnostics: public psxexe::Diagnostics
	{
		Ref<Logger> m_logger;

	protected:
		void Emit(psxexe::DiagnosticLevel level, const std::string& message) override;

	public:
		explicit LoggerDiagnostics(Ref<Logger> logger) : m_logger(logger) {}
	};

	class PsxExeAddressSpace: public psxexe::AddressSpace
	{
		struct RegionRecord
		{
			std::string name;
			uint64_t start;
			uint64_t size;
			uint32_t flags;
			uint64_t fileOffset;
			uint64_t fileLength;
		};

		BinaryView* m_view;
		Ref<Architecture> m_arch;
		Ref<Platform> m_plat;
		Ref<Logger> m_logger;
		std::function<bool()> m_cancelled;
		std::map<uint64_t, RegionRecord> m_regions;

		bool Overlaps(uint64_t start, uint64_t size, std::string& error) const;
		bool LookupRegion(uint64_t start, RegionRecord& out) const;

	public:
		/**
		 * @param view       View being populated; must outlive this object.
		 * @param plat       Platform used for functions and entry points.
		 * @param cancelled  Polled by IsCancelled(); may be empty.
		 */
		PsxExeAddressSpace(BinaryView* view, Ref<Platform> plat, Ref<Logger> logger,
			std::function<bool()> cancelled = {});

		bool IsCancelled() const override;

		bool CreateRegion(const std::string& name, uint64_t start, uint64_t size, uint32_t flags,
			uint64_t fileOffset, uint64_t fileLength, std::string& error) override;
		bool CreateMirror(const std::string& name, uint64_t baseStart, uint64_t start, uint64_t size,
			std::string& error) override;
		bool CreateSection(const std::string& name, uint64_t start, uint64_t size, psxexe::SectionKind kind,
			std::string& error) override;

		bool FindRegion(uint64_t address, uint64_t& start, uint64_t& end) const override;
		size_t Read(uint64_t address, size_t length, std::vector<uint8_t>& out) const override;
		bool DecodeReferences(uint64_t address, std::vector<uint64_t>& references, std::string& error) override;

		bool DefineLabel(uint64_t address, const std::string& name, psxexe::SymbolKind kind,
			std::string& error) override;
		bool DefineData(uint64_t address, uint8_t width, uint32_t count, std::string& error) override;
		bool CreateFunction(uint64_t address, std::string& error) override;
		bool AddEntryPoint(uint64_t address, std::string& error) override;
		bool SetRegisterDefault(const std::string& reg, uint64_t value, std::string& error) override;
	};

	uint32_t ToSegmentFlags(uint32_t regionFlags);
}
