#include "inc/errorCollection.h"
#include "inc/helper.h"
#include "inc/IOManager.h"
#include "inc/stringManager.h"

// basic includes
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char** argv) {
	std::cout << " " << std::endl;
	std::string issueEncounterString = errorWarningStringEnum::getString(ErrorID::warningIssueencountered);

	std::vector<std::string> inputPathList;
	for (int i = 1; i < argc; i++) { inputPathList.emplace_back(argv[i]); }

	IOManager manager;
	bool success = false;
	try
	{
		success = manager.init(inputPathList);
	}
	catch (const std::string& exceptionString)
	{
		std::cout << issueEncounterString << std::endl;
		std::cout << exceptionString << std::endl;
		ErrorCollection::getInstance().addError(ErrorID::errorFailedInit);
		success = false;
	}

	if (!success)
	{
		std::cout << errorWarningStringEnum::getString(ErrorID::errorUnableToProcessFile) << std::endl;
		manager.write(true);
		return 1;
	}

	if (!manager.run())
	{
		std::cout << errorWarningStringEnum::getString(ErrorID::errorUnableToProcessFile) << std::endl;
		manager.write();
		return 1;
	}
	if (!manager.write()) { return 1; }
	return 0;
}
