#include "wasm_opcode_info.h"

namespace WasmAbi
{

namespace
{

std::string FormatNotFoundMessage(std::string_view name)
{
    std::string msg = "opcode not found: '";
    msg.append(name.data(), name.size());
    msg.append("'");
    return msg;
}

}   // anonymous namespace

WasmOpcodeNotFound::WasmOpcodeNotFound(std::string_view name)
    : std::runtime_error(FormatNotFoundMessage(name))
{ }

const char* WasmOpcodeTableStatusName(WasmOpcodeTableStatus status)
{
    switch (status)
    {
    case WasmOpcodeTableStatus::OK: return "OK";
    case WasmOpcodeTableStatus::BadEncoding: return "BadEncoding";
    case WasmOpcodeTableStatus::DuplicateEncoding: return "DuplicateEncoding";
    case WasmOpcodeTableStatus::EmptyName: return "EmptyName";
    case WasmOpcodeTableStatus::DuplicateName: return "DuplicateName";
    }
    return "(invalid)";
}

std::string WasmOpcodeInfo::ToString() const
{
    char buf[128];
    int len = snprintf(buf, sizeof(buf), "Op( 0x%02x \"%.*s\" {%s %db} [%s,%s]->[%s] )",
                       static_cast<unsigned int>(m_encoding),
                       static_cast<int>(m_name.size()), m_name.data(),
                       WasmImmediateKindName(m_immKind),
                       static_cast<int>(m_immBytes),
                       WasmStackEffectName(m_pop[0]),
                       WasmStackEffectName(m_pop[1]),
                       WasmStackEffectName(m_push));
    ReleaseAssert(len > 0 && static_cast<size_t>(len) < sizeof(buf));
    return std::string(buf, static_cast<size_t>(len));
}

const WasmOpcodeInfo* WasmOpcodeInfoTable::TryByName(std::string_view name) const
{
    ReleaseAssert(m_status == WasmOpcodeTableStatus::OK);

    // Binary search without an explicit midpoint: 'size' is the width of the window starting at 'cur'.
    // Each step probes cur + size/2; when the window is odd, moving right also skips the extra element.
    //
    size_t cur = 0;
    size_t size = m_numDeclared;
    while (size > 0)
    {
        size_t offset = size % 2;
        size /= 2;
        const WasmOpcodeInfo& info = m_info[m_sortedEncodings[cur + size]];
        int cmp = name.compare(info.m_name);
        if (cmp == 0)
        {
            return &info;
        }
        if (cmp > 0)
        {
            cur += size + offset;
        }
    }
    return nullptr;
}

const WasmOpcodeInfo& WasmOpcodeInfoTable::ByName(std::string_view name) const
{
    const WasmOpcodeInfo* result = TryByName(name);
    if (result == nullptr)
    {
        throw WasmOpcodeNotFound(name);
    }
    return *result;
}

}   // namespace WasmAbi
