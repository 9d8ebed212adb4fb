/*
 * Project: ASIMS2000 Device Adapter
 * License/Copyright: BSD 3-clause, see license.txt
 */

#include "LeadScrew.h"

namespace {

// pitch (mm), resolution (nm), maximum velocity (mm/s)
const LeadScrew g_LeadScrews[] = {
	LeadScrew("UC", 25.40, 88.0, 28.0),  // ultra-coarse
	LeadScrew("SC", 12.70, 44.0, 14.0),  // super-coarse
	LeadScrew("S", 6.350, 22.0, 7.00),   // standard
	LeadScrew("F", 1.590, 5.50, 1.75),   // fine
	LeadScrew("XF", 0.653, 2.20, 0.70),  // extra-fine
};

const size_t g_NumLeadScrews = sizeof(g_LeadScrews) / sizeof(g_LeadScrews[0]);

} // namespace

bool FindLeadScrew(const std::string& name, LeadScrew& screw)
{
	for (size_t i = 0; i < g_NumLeadScrews; i++)
	{
		if (g_LeadScrews[i].name == name)
		{
			screw = g_LeadScrews[i];
			return true;
		}
	}
	return false;
}

std::vector<std::string> GetLeadScrewNames()
{
	std::vector<std::string> names;
	for (size_t i = 0; i < g_NumLeadScrews; i++)
	{
		names.push_back(g_LeadScrews[i].name);
	}
	return names;
}
