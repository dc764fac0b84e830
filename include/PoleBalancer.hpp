//
// Created by moinshaikh on 3/8/26.
//

#pragma once

#include"Algorithms/Algorithm.hpp"
#include"Algorithms/DQN.hpp"
#include"Config.hpp"
#include"Environment.hpp"
#include"EpisodeLog.hpp"
#include"Exploration/EpsilonGreedy.hpp"
#include"Model/QNetwork.hpp"
#include"Model/ValueEstimator.hpp"
#include"ReplayBuffer.hpp"
#include"RewardShaping.hpp"
#include"Space.hpp"
#include"Trainer.hpp"
#include"Transition.hpp"
