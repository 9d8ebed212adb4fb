/*
 * Project: ASIMS2000 Device Adapter
 * License/Copyright: BSD 3-clause, see license.txt
 */

#ifndef LEADSCREW_H
#define LEADSCREW_H

#include <string>
#include <vector>

// Drive screw option of an MS-2000 axis
struct LeadScrew {
	std::string name;
	double pitchMm;
	double resolutionNm;
	double maxVelocityMmps;

	LeadScrew() : pitchMm(0.0), resolutionNm(0.0), maxVelocityMmps(0.0) { }
	LeadScrew(const char* n, double pitch, double resolution, double maxVelocity) :
		name(n), pitchMm(pitch), resolutionNm(resolution), maxVelocityMmps(maxVelocity) { }
};

const char* const g_DefaultLeadScrew = "S";

// UC, SC, S, F, XF
bool FindLeadScrew(const std::string& name, LeadScrew& screw);
std::vector<std::string> GetLeadScrewNames();

#endif // LEADSCREW_H
