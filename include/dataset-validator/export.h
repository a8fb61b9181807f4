#ifndef DATASET_VALIDATOR_EXPORT_H
#define DATASET_VALIDATOR_EXPORT_H

#ifdef _WIN32
#ifdef dataset_validator_core_EXPORTS
#define DATASET_VALIDATOR_API __declspec(dllexport)
#else
#define DATASET_VALIDATOR_API __declspec(dllimport)
#endif
#else
#define DATASET_VALIDATOR_API
#endif

#endif // DATASET_VALIDATOR_EXPORT_H
