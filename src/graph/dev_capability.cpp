// Copyright (c) 2026 The Proxigraph Core developers
// Distributed under the MIT software license

#include <graph/dev_capability.h>

std::string CDevCapability::ToString() const
{
    return "CDevCapability(id=" + std::to_string(m_id) + ", owner=" + m_owner.ToShortString() + ")";
}
