#pragma once

#include <string_view>

#include <NGIN/Metadata/Export.hpp>
#include <NGIN/Metadata/Types.hpp>
#include <NGIN/Metadata/ElementType.hpp>
#include <NGIN/Metadata/BlobReader.hpp>
#include <NGIN/Metadata/BlobHeap.hpp>
#include <NGIN/Metadata/TypeSig.hpp>
#include <NGIN/Metadata/Module.hpp>
#include <NGIN/Metadata/TypeNameParser.hpp>
#include <NGIN/Metadata/AssemblySearch.hpp>
#include <NGIN/Metadata/CustomAttribute.hpp>
#include <NGIN/Metadata/CustomAttributeReader.hpp>

namespace NGIN::Metadata
{

    // For quick sanity checks / examples.
    [[nodiscard]] constexpr std::string_view LibraryName() noexcept { return "NGIN.Metadata"; }

} // namespace NGIN::Metadata
